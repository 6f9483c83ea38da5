// include/OrderEngineApp.hpp
#pragma once

#include <atomic>
#include <memory>

namespace marketplace {

namespace adapters::secondary {
    class RabbitMQAdapter;
}

namespace application {
    class OrderCommandHandler;
}

/**
 * @class OrderEngineApp
 * @brief Движок заказов маркетплейса (event-driven)
 *
 * Слушает: order.place, order.cancel (marketplace.events)
 * Публикует: order.placed, order.rejected, order.cancelled, order.cancel_failed
 *
 * Жизненный цикл (Template Method):
 * 1. loadEnvironment(): настройки из ENV
 * 2. configureInjection(): сборка графа через Boost.DI, подписка на команды
 * 3. ожидание stop(), затем остановка RabbitMQ
 */
class OrderEngineApp {
public:
    OrderEngineApp();
    ~OrderEngineApp();

    void run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку (можно вызывать из обработчика сигнала)
     */
    void stop();

protected:
    void loadEnvironment(int argc, char* argv[]);

    void configureInjection();

private:
    void waitForStop();

    std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
    std::shared_ptr<application::OrderCommandHandler> orderCommandHandler_;

    std::atomic<bool> stopRequested_{false};
};

} // namespace marketplace
