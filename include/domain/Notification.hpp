#pragma once

#include "Timestamp.hpp"
#include "enums/NotificationType.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace marketplace::domain {

/**
 * @brief Уведомление пользователю (таблица notifications)
 *
 * data: структурированные данные для клиента, например
 * {"productName": "...", "stockQuantity": 3} для low_stock.
 */
struct Notification {
    std::string id;
    std::string userId;
    NotificationType type = NotificationType::ORDER_STATUS;
    std::string title;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    bool isRead = false;
    Timestamp createdAt;
};

} // namespace marketplace::domain
