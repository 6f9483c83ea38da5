#pragma once

#include "domain/enums/OrderStatus.hpp"
#include <cstdint>
#include <string>

namespace marketplace::ports::input {

/**
 * @brief Интерфейс сервиса уведомлений
 *
 * Fire-and-forget: реализации не выбрасывают исключений,
 * ошибки только пишутся в лог.
 */
class INotificationService {
public:
    virtual ~INotificationService() = default;

    virtual void notifyLowStock(const std::string& vendorUserId, const std::string& productName,
                                int64_t remainingQuantity) = 0;

    virtual void notifyOrderStatus(const std::string& userId, const std::string& orderId,
                                   domain::OrderStatus status, const std::string& orderNumber) = 0;
};

} // namespace marketplace::ports::input
