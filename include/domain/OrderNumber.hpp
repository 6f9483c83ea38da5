#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace marketplace::domain {

/**
 * @brief Человекочитаемый номер заказа: "ZK-2026-000042"
 *
 * Суффикс берётся из последовательности хранилища, поэтому номера не
 * повторяются при конкурентном создании заказов. Не первичный ключ.
 */
class OrderNumber {
public:
    static std::string format(const std::string& prefix, int year, int64_t sequence) {
        std::ostringstream ss;
        ss << prefix << "-" << year << "-" << std::setfill('0') << std::setw(6) << sequence;
        return ss.str();
    }
};

} // namespace marketplace::domain
