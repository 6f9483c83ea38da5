#pragma once

#include <string>

namespace marketplace::domain {

enum class OrderStatus {
    PENDING,
    CONFIRMED,
    PREPARING,
    READY_FOR_PICKUP,
    IN_TRANSIT,
    DELIVERED,
    CANCELLED
};

/**
 * @brief Значение для колонки orders.status (order_status enum в БД)
 */
inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::CONFIRMED: return "confirmed";
        case OrderStatus::PREPARING: return "preparing";
        case OrderStatus::READY_FOR_PICKUP: return "ready_for_pickup";
        case OrderStatus::IN_TRANSIT: return "in_transit";
        case OrderStatus::DELIVERED: return "delivered";
        case OrderStatus::CANCELLED: return "cancelled";
        default: return "pending";
    }
}

inline OrderStatus parseOrderStatus(const std::string& str) {
    if (str == "confirmed") return OrderStatus::CONFIRMED;
    if (str == "preparing") return OrderStatus::PREPARING;
    if (str == "ready_for_pickup") return OrderStatus::READY_FOR_PICKUP;
    if (str == "in_transit") return OrderStatus::IN_TRANSIT;
    if (str == "delivered") return OrderStatus::DELIVERED;
    if (str == "cancelled") return OrderStatus::CANCELLED;
    return OrderStatus::PENDING;
}

} // namespace marketplace::domain
