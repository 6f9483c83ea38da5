// include/domain/CommissionCalculator.hpp
#pragma once

#include "CommissionSplit.hpp"
#include "Money.hpp"
#include "exceptions/OrderException.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace marketplace::domain {

/**
 * @brief Расчёт комиссии маркетплейса
 *
 * Комиссия считается только от subtotal (стоимость товаров),
 * доставка и налог в базу не входят.
 *
 * @example
 * ```cpp
 * auto split = CommissionCalculator::computeSplit(Decimal(3000), Decimal("5.00"));
 * // commissionAmount = 150.00, vendorEarnings = 2850.00, platformRevenue = 150.00
 * ```
 */
class CommissionCalculator {
public:
    static Decimal defaultRatePercent() { return Decimal("5.00"); }

    /**
     * @param subtotal Стоимость товаров
     * @param vendorRatePercent Ставка продавца в процентах (nullopt → ставка по умолчанию)
     * @param defaultRate Ставка платформы по умолчанию
     * @throws InvalidCommissionRateException ставка вне [0, 100]
     */
    static CommissionSplit computeSplit(const Decimal& subtotal,
                                        const std::optional<Decimal>& vendorRatePercent,
                                        const Decimal& defaultRate = defaultRatePercent()) {
        Decimal rate = vendorRatePercent.value_or(defaultRate);
        if (rate < 0 || rate > 100) {
            throw InvalidCommissionRateException(rate.str());
        }

        Decimal base = Money::roundMoney(subtotal);

        CommissionSplit split;
        split.rate = rate;
        split.commissionAmount = Money::roundMoney(Money::calculatePercentage(base, rate));
        split.vendorEarnings = base - split.commissionAmount;
        split.platformRevenue = split.commissionAmount;
        return split;
    }

    /**
     * @brief Ставка продавца из колонки vendors.commission_rate
     *
     * Пустое или некорректное значение даёт nullopt (будет ставка по умолчанию).
     */
    static std::optional<Decimal> parseRate(const std::optional<std::string>& rate) {
        if (!rate || rate->empty()) {
            return std::nullopt;
        }
        auto parsed = Money::parseDecimal(*rate);
        if (!parsed) {
            std::cerr << "[CommissionCalculator] Invalid vendor commission rate '" << *rate
                      << "', using default" << std::endl;
        }
        return parsed;
    }
};

} // namespace marketplace::domain
