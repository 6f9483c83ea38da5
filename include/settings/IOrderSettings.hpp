#pragma once

#include "domain/Money.hpp"
#include <cstdint>
#include <string>

namespace marketplace::settings {

/**
 * @brief Настройки движка заказов
 */
class IOrderSettings {
public:
    virtual ~IOrderSettings() = default;

    virtual std::string getOrderNumberPrefix() const = 0;
    virtual domain::Decimal getDefaultCommissionRate() const = 0;
    virtual int64_t getLowStockThreshold() const = 0;
    virtual bool shouldValidateTotals() const = 0;
};

} // namespace marketplace::settings
