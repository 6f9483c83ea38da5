#pragma once

#include <cstdint>
#include <string>

namespace marketplace::domain {

/**
 * @brief Позиция корзины в запросе на заказ (как есть не сохраняется)
 */
struct OrderLineRequest {
    std::string productId;
    int64_t requestedQuantity = 1;
    std::string unitPrice = "0.00";
};

} // namespace marketplace::domain
