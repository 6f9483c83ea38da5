#pragma once

#include "domain/Notification.hpp"

namespace marketplace::ports::output {

/**
 * @brief Интерфейс репозитория уведомлений
 */
class INotificationRepository {
public:
    virtual ~INotificationRepository() = default;

    /**
     * @brief Сохранить уведомление
     * @return Уведомление с присвоенным id
     */
    virtual domain::Notification save(const domain::Notification& notification) = 0;
};

} // namespace marketplace::ports::output
