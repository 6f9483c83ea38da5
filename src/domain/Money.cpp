#include "domain/Money.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <regex>
#include <sstream>

namespace marketplace::domain {

namespace {

const std::regex& decimalPattern() {
    static const std::regex pattern(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)");
    return pattern;
}

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string removeIgnoreCase(std::string text, const std::string& token) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string needle = token;
    std::transform(needle.begin(), needle.end(), needle.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto pos = lower.find(needle);
    while (pos != std::string::npos) {
        text.erase(pos, needle.size());
        lower.erase(pos, needle.size());
        pos = lower.find(needle);
    }
    return text;
}

} // namespace

Money Money::fromString(const std::string& value, const std::string& cur) {
    if (trim(value).empty()) {
        return Money(Decimal(0), cur);
    }
    auto parsed = parseDecimal(value);
    if (!parsed) {
        std::cerr << "[Money] Invalid money value: " << value << std::endl;
        return Money(Decimal(0), cur);
    }
    return Money(*parsed, cur);
}

Money Money::fromMinorUnit(int64_t minorAmount, const std::string& cur) {
    return Money(toMajorUnit(minorAmount), cur);
}

std::optional<Decimal> Money::parseDecimal(const std::string& value) {
    std::string text = trim(value);
    if (text.empty() || !std::regex_match(text, decimalPattern())) {
        return std::nullopt;
    }
    try {
        Decimal parsed(text.c_str());
        if (!isFinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t Money::toMinorUnit(const std::string& amount) {
    if (trim(amount).empty()) {
        return 0;
    }
    auto parsed = parseDecimal(amount);
    if (!parsed) {
        std::cerr << "[Money] Invalid amount for conversion: " << amount << std::endl;
        return 0;
    }
    return toMinorUnit(*parsed);
}

int64_t Money::toMinorUnit(const Decimal& amount) {
    if (!isFinite(amount)) {
        std::cerr << "[Money] Invalid amount for conversion: " << amount.str() << std::endl;
        return 0;
    }

    Decimal minor = roundHalfUp(amount * 100, 0);
    static const Decimal maxMinor(std::numeric_limits<int64_t>::max());
    static const Decimal minMinor(std::numeric_limits<int64_t>::min());
    if (minor > maxMinor || minor < minMinor) {
        std::cerr << "[Money] Amount out of range for minor units: " << amount.str() << std::endl;
        return 0;
    }
    return minor.convert_to<int64_t>();
}

int64_t Money::toMinorUnit(double amount) {
    if (!std::isfinite(amount)) {
        std::cerr << "[Money] Invalid amount for conversion: " << amount << std::endl;
        return 0;
    }
    return toMinorUnit(fromDouble(amount));
}

Decimal Money::toMajorUnit(int64_t minorAmount) {
    return Decimal(minorAmount) / 100;
}

Decimal Money::calculateCommission(const Decimal& amount, const Decimal& rate) {
    if (!isFinite(amount) || !isFinite(rate)) {
        std::cerr << "[Money] Invalid commission calculation: amount=" << amount.str()
                  << ", rate=" << rate.str() << std::endl;
        return Decimal(0);
    }
    return amount * rate;
}

Decimal Money::calculateCommission(const std::string& amount, const std::string& rate) {
    auto a = parseDecimal(amount);
    auto r = parseDecimal(rate);
    if (!a || !r) {
        std::cerr << "[Money] Invalid commission calculation: amount=" << amount
                  << ", rate=" << rate << std::endl;
        return Decimal(0);
    }
    return calculateCommission(*a, *r);
}

Decimal Money::calculatePercentage(const Decimal& value, const Decimal& percentage) {
    if (!isFinite(value) || !isFinite(percentage)) {
        std::cerr << "[Money] Invalid percentage calculation: value=" << value.str()
                  << ", percentage=" << percentage.str() << std::endl;
        return Decimal(0);
    }
    return value * percentage / 100;
}

Decimal Money::calculatePercentage(const std::string& value, const std::string& percentage) {
    auto v = parseDecimal(value);
    auto p = parseDecimal(percentage);
    if (!v || !p) {
        std::cerr << "[Money] Invalid percentage calculation: value=" << value
                  << ", percentage=" << percentage << std::endl;
        return Decimal(0);
    }
    return calculatePercentage(*v, *p);
}

Decimal Money::sumAmounts(const std::vector<std::optional<std::string>>& amounts) {
    Decimal sum = 0;
    for (const auto& amount : amounts) {
        if (!amount || trim(*amount).empty()) {
            std::cout << "[Money] Skipping empty amount in sum" << std::endl;
            continue;
        }
        auto parsed = parseDecimal(*amount);
        if (!parsed) {
            std::cerr << "[Money] Skipping invalid amount in sum: " << *amount << std::endl;
            continue;
        }
        sum += *parsed;
    }
    return sum;
}

Decimal Money::sumAmounts(const std::vector<Decimal>& amounts) {
    Decimal sum = 0;
    for (const auto& amount : amounts) {
        if (!isFinite(amount)) {
            std::cerr << "[Money] Skipping invalid amount in sum: " << amount.str() << std::endl;
            continue;
        }
        sum += amount;
    }
    return sum;
}

Decimal Money::roundMoney(const Decimal& amount) {
    if (!isFinite(amount)) {
        std::cerr << "[Money] Invalid amount for rounding: " << amount.str() << std::endl;
        return Decimal(0);
    }
    return roundHalfUp(amount, 2);
}

Decimal Money::roundMoney(const std::string& amount) {
    auto parsed = parseDecimal(amount);
    if (!parsed) {
        std::cerr << "[Money] Invalid amount for rounding: " << amount << std::endl;
        return Decimal(0);
    }
    return roundHalfUp(*parsed, 2);
}

std::string Money::toFixed(const Decimal& amount) {
    return roundMoney(amount).str(2, std::ios_base::fixed);
}

std::string Money::formatMoney(const std::string& amount, const std::string& currency) {
    auto parsed = parseDecimal(amount);
    if (!parsed) {
        return "0 CFA";
    }

    std::string fixed = toFixed(*parsed);
    std::string sign;
    if (!fixed.empty() && fixed[0] == '-') {
        sign = "-";
        fixed.erase(0, 1);
    }

    auto dot = fixed.find('.');
    std::string integral = fixed.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : fixed.substr(dot);

    std::string grouped;
    int counter = 0;
    for (auto it = integral.rbegin(); it != integral.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++counter;
    }

    std::string suffix = currency == "XOF" ? "CFA" : currency;
    return sign + grouped + fraction + " " + suffix;
}

bool Money::isValidMoneyAmount(const std::string& amount) {
    auto parsed = parseDecimal(amount);
    return parsed && *parsed >= 0;
}

std::optional<Decimal> Money::parseMoneyInput(const std::string& input) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char c : input) {
        if (c != ',' && !std::isspace(static_cast<unsigned char>(c))) {
            cleaned.push_back(c);
        }
    }
    cleaned = removeIgnoreCase(cleaned, "CFA");
    cleaned = removeIgnoreCase(cleaned, "XOF");

    auto parsed = parseDecimal(cleaned);
    if (!parsed || *parsed < 0) {
        return std::nullopt;
    }
    return parsed;
}

Decimal Money::fromDouble(double value) {
    if (!std::isfinite(value)) {
        std::cerr << "[Money] Invalid floating point amount: " << value << std::endl;
        return Decimal(0);
    }
    // 15 значащих цифр: 2.675 остаётся 2.675, а не 2.67499999...
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    return parseDecimal(ss.str()).value_or(Decimal(0));
}

Decimal Money::roundHalfUp(const Decimal& value, int places) {
    Decimal scale = 1;
    for (int i = 0; i < places; ++i) {
        scale *= 10;
    }

    Decimal scaled = value * scale;
    Decimal rounded = scaled >= 0
        ? boost::multiprecision::floor(scaled + Decimal("0.5"))
        : -boost::multiprecision::floor(-scaled + Decimal("0.5"));

    if (rounded == 0) {
        return Decimal(0);
    }
    return rounded / scale;
}

bool Money::isFinite(const Decimal& value) {
    return (boost::multiprecision::isfinite)(value);
}

} // namespace marketplace::domain
