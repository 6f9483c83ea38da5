#pragma once

#include <optional>
#include <string>

namespace marketplace::domain {

/**
 * @brief Продавец
 *
 * commissionRate: процент строкой ("5.00"), как в колонке DECIMAL(5,2).
 * Если не задан, используется ставка платформы по умолчанию.
 */
struct Vendor {
    std::string id;
    std::string userId;
    std::string businessName;
    std::optional<std::string> commissionRate;
};

} // namespace marketplace::domain
