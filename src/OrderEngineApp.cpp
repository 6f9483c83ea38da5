#include "OrderEngineApp.hpp"

#include <boost/di.hpp>

// Ports
#include "ports/input/IOrderService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/input/INotificationService.hpp"
#include "ports/output/IOrderStore.hpp"
#include "ports/output/INotificationRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/OrderSettings.hpp"

// Application
#include "application/OrderService.hpp"
#include "application/InventoryService.hpp"
#include "application/NotificationService.hpp"
#include "application/OrderCommandHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresOrderStore.hpp"
#include "adapters/secondary/PostgresNotificationRepository.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

namespace marketplace {

OrderEngineApp::OrderEngineApp() {
    std::cout << "[OrderEngineApp] Initializing..." << std::endl;
}

OrderEngineApp::~OrderEngineApp() {
    if (rabbitMQAdapter_) {
        rabbitMQAdapter_->stop();
    }
    std::cout << "[OrderEngineApp] Shutting down..." << std::endl;
}

void OrderEngineApp::run(int argc, char* argv[]) {
    loadEnvironment(argc, argv);
    configureInjection();
    waitForStop();

    std::cout << "[OrderEngineApp] Stopping RabbitMQ consumer..." << std::endl;
    rabbitMQAdapter_->stop();
}

void OrderEngineApp::stop() {
    // Только atomic store: вызывается из обработчика сигнала
    stopRequested_.store(true);
}

void OrderEngineApp::loadEnvironment(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    settings::OrderSettings orderSettings;
    std::cout << "[OrderEngineApp] Environment loaded: prefix=" << orderSettings.getOrderNumberPrefix()
              << " default_commission=" << domain::Money::toFixed(orderSettings.getDefaultCommissionRate())
              << " low_stock_threshold=" << orderSettings.getLowStockThreshold()
              << " validate_totals=" << (orderSettings.shouldValidateTotals() ? "true" : "false")
              << std::endl;
}

void OrderEngineApp::configureInjection() {
    std::cout << "[OrderEngineApp] Configuring DI..." << std::endl;

    // Шаг 1: один RabbitMQAdapter для Publisher и Consumer
    auto rabbitInjector = di::make_injector(
        di::bind<settings::RabbitMQSettings>().in(di::singleton)
    );
    rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

    // Шаг 2: основной injector
    auto injector = di::make_injector(
        di::bind<settings::DbSettings>().in(di::singleton),
        di::bind<settings::IOrderSettings>().to<settings::OrderSettings>().in(di::singleton),

        di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
        di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_),

        di::bind<ports::output::IOrderStore>().to<adapters::secondary::PostgresOrderStore>().in(di::singleton),
        di::bind<ports::output::INotificationRepository>().to<adapters::secondary::PostgresNotificationRepository>().in(di::singleton),

        di::bind<ports::input::INotificationService>().to<application::NotificationService>().in(di::singleton),
        di::bind<ports::input::IInventoryService>().to<application::InventoryService>().in(di::singleton),
        di::bind<ports::input::IOrderService>().to<application::OrderService>().in(di::singleton)
    );

    // Шаг 3: OrderCommandHandler подписывается в конструкторе
    orderCommandHandler_ = injector.create<std::shared_ptr<application::OrderCommandHandler>>();

    // Шаг 4: RabbitMQ запускается ПОСЛЕ регистрации handlers
    std::cout << "[OrderEngineApp] Starting RabbitMQ consumer..." << std::endl;
    rabbitMQAdapter_->start();

    std::cout << "[OrderEngineApp] Ready (commands via RabbitMQ)" << std::endl;
}

void OrderEngineApp::waitForStop() {
    while (!stopRequested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

} // namespace marketplace
