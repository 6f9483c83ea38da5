#pragma once

#include <cstdint>
#include <string>

namespace marketplace::domain {

/**
 * @brief Изменение остатка товара внутри транзакции
 *
 * Используется после commit для уведомлений о низком остатке.
 */
struct StockChange {
    std::string productId;
    std::string productName;
    std::string vendorId;
    int64_t quantityBefore = 0;
    int64_t quantityAfter = 0;
};

} // namespace marketplace::domain
