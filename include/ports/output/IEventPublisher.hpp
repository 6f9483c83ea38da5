#pragma once

#include <string>

namespace marketplace::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQAdapter.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "order.placed")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace marketplace::ports::output
