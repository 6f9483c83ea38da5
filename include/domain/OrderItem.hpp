#pragma once

#include "Money.hpp"
#include <cstdint>
#include <string>

namespace marketplace::domain {

/**
 * @brief Позиция заказа, неизменяема после создания
 */
struct OrderItem {
    std::string id;
    std::string orderId;
    std::string productId;
    int64_t quantity = 0;
    Money unitPrice;
    Money totalPrice;
};

} // namespace marketplace::domain
