#pragma once

#include <string>

namespace marketplace::domain {

enum class NotificationType {
    ORDER_STATUS,
    LOW_STOCK
};

inline std::string toString(NotificationType type) {
    switch (type) {
        case NotificationType::ORDER_STATUS: return "order_status";
        case NotificationType::LOW_STOCK: return "low_stock";
        default: return "order_status";
    }
}

inline NotificationType parseNotificationType(const std::string& str) {
    if (str == "low_stock") return NotificationType::LOW_STOCK;
    return NotificationType::ORDER_STATUS;
}

} // namespace marketplace::domain
