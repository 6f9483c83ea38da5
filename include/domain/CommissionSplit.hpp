#pragma once

#include "Money.hpp"
#include <string>

namespace marketplace::domain {

/**
 * @brief Разделение subtotal между продавцом и платформой
 *
 * Снимок на момент продажи: сохраняется в заказе и больше не пересчитывается.
 * vendorEarnings + commissionAmount == subtotal (без потерь на округлении).
 */
struct CommissionSplit {
    Decimal rate = 0;               ///< Процент ("5.00" = 5%)
    Decimal commissionAmount = 0;
    Decimal vendorEarnings = 0;
    Decimal platformRevenue = 0;    ///< Комиссия и есть доход платформы

    std::string rateFixed() const { return Money::toFixed(rate); }
    std::string commissionAmountFixed() const { return Money::toFixed(commissionAmount); }
    std::string vendorEarningsFixed() const { return Money::toFixed(vendorEarnings); }
    std::string platformRevenueFixed() const { return Money::toFixed(platformRevenue); }
};

} // namespace marketplace::domain
