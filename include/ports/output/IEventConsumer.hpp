// include/ports/output/IEventConsumer.hpp
#pragma once

#include <string>
#include <vector>
#include <functional>

namespace marketplace::ports::output {

/**
 * @brief Обработчик событий: routingKey и JSON-сообщение
 */
using EventHandler = std::function<void(const std::string& routingKey, const std::string& message)>;

/**
 * @brief Интерфейс потребителя событий
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"order.place", "order.cancel"},
 *     [this](const std::string& routingKey, const std::string& message) {
 *         handleCommand(routingKey, message);
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    /**
     * @brief Подписаться на события
     * @param routingKeys Список ключей маршрутизации
     * @param handler Обработчик
     */
    virtual void subscribe(const std::vector<std::string>& routingKeys, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace marketplace::ports::output
