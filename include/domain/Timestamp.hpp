#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace marketplace::domain {

/**
 * @brief Временная метка (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    int64_t toEpochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Год по UTC (для номера заказа)
     */
    int year() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);
        return tm.tm_year + 1900;
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }
};

} // namespace marketplace::domain
