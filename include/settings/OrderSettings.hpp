#pragma once

#include "IOrderSettings.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace marketplace::settings {

/**
 * @brief Настройки движка заказов из ENV
 *
 * - ORDER_NUMBER_PREFIX (default: "ZK")
 * - ORDER_DEFAULT_COMMISSION_RATE (default: "5.00", проценты)
 * - ORDER_LOW_STOCK_THRESHOLD (default: 5)
 * - ORDER_VALIDATE_TOTALS (default: true)
 */
class OrderSettings : public IOrderSettings {
public:
    OrderSettings() {
        if (const char* prefix = std::getenv("ORDER_NUMBER_PREFIX")) {
            prefix_ = prefix;
        }
        if (const char* rate = std::getenv("ORDER_DEFAULT_COMMISSION_RATE")) {
            auto parsed = domain::Money::parseDecimal(rate);
            if (parsed) {
                defaultCommissionRate_ = *parsed;
            } else {
                std::cerr << "[OrderSettings] Invalid ORDER_DEFAULT_COMMISSION_RATE: " << rate
                          << ", using 5.00" << std::endl;
            }
        }
        if (const char* threshold = std::getenv("ORDER_LOW_STOCK_THRESHOLD")) {
            lowStockThreshold_ = std::stoll(threshold);
        }
        if (const char* validate = std::getenv("ORDER_VALIDATE_TOTALS")) {
            std::string value = validate;
            validateTotals_ = !(value == "false" || value == "0" || value == "no");
        }
    }

    std::string getOrderNumberPrefix() const override { return prefix_; }
    domain::Decimal getDefaultCommissionRate() const override { return defaultCommissionRate_; }
    int64_t getLowStockThreshold() const override { return lowStockThreshold_; }
    bool shouldValidateTotals() const override { return validateTotals_; }

private:
    std::string prefix_ = "ZK";
    domain::Decimal defaultCommissionRate_ = domain::Decimal("5.00");
    int64_t lowStockThreshold_ = 5;
    bool validateTotals_ = true;
};

} // namespace marketplace::settings
