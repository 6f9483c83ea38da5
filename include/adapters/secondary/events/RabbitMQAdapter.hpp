// include/adapters/secondary/events/RabbitMQAdapter.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace marketplace::adapters::secondary {

/**
 * @brief RabbitMQ адаптер: публикация событий и приём команд
 *
 * Реализует IEventPublisher и IEventConsumer.
 *
 * - Exchange: topic (marketplace.events)
 * - Команды: order.place, order.cancel
 * - События: order.placed, order.rejected, order.cancelled, order.cancel_failed
 * - Очередь команд durable, сообщение подтверждается после обработки
 *
 * Все операции с каналом выполняются в потоке io_context:
 * AMQP-CPP не потокобезопасен, поэтому publish() только ставит задачу в очередь.
 *
 * @example
 * ```cpp
 * auto adapter = std::make_shared<RabbitMQAdapter>(std::make_shared<RabbitMQSettings>());
 * adapter->subscribe({"order.place"}, [](const std::string& key, const std::string& msg) {
 *     std::cout << key << ": " << msg << std::endl;
 * });
 * adapter->start();
 * adapter->publish("order.placed", R"({"order_id":"..."})");
 * ```
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        queueName_ = settings_->getQueue();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_
                  << " queue=" << queueName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": not running" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_ || !channel_->usable()) {
                std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": channel not ready" << std::endl;
                return;
            }
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQAdapter] Published " << routingKey
                      << ": " << message.substr(0, 100) << std::endl;
        });
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
            pendingBindings_.push_back(key);
        }
    }

    void start() override {
        if (running_) return;

        running_ = true;
        workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
        workerDone_ = std::promise<void>();
        workerFinished_ = workerDone_.get_future();

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
            workerDone_.set_value();
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_) return;

        running_ = false;
        workGuard_.reset();
        boost::asio::post(ioContext_, [this]() {
            if (connection_) {
                connection_->close();
            }
        });

        // io-поток сам выходит из run(), когда close() завершён и работы не осталось
        if (workerFinished_.valid() &&
            workerFinished_.wait_for(CLOSE_TIMEOUT) == std::future_status::timeout) {
            std::cerr << "[RabbitMQAdapter] Connection close timed out, stopping io context" << std::endl;
            ioContext_.stop();
        }

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                setupBindings();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void setupBindings() {
        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t messageCount, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << name
                          << " (" << messageCount << " pending)" << std::endl;

                std::lock_guard<std::mutex> lock(handlersMutex_);
                for (const auto& key : pendingBindings_) {
                    channel_->bindQueue(exchangeName_, queueName_, key);
                    std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                }
                pendingBindings_.clear();

                startConsuming();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue error: " << msg << std::endl;
            });
    }

    void startConsuming() {
        // Команды обрабатываются по одной
        channel_->setQos(1);

        channel_->consume(queueName_)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::vector<ports::output::EventHandler> handlers;
                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    auto it = handlers_.find(routingKey);
                    if (it != handlers_.end()) {
                        handlers = it->second;
                    }
                }

                for (const auto& handler : handlers) {
                    try {
                        handler(routingKey, body);
                    } catch (const std::exception& e) {
                        std::cerr << "[RabbitMQAdapter] Handler error on " << routingKey
                                  << ": " << e.what() << std::endl;
                    }
                }

                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string queueName_;

    std::atomic<bool> running_;
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;
    std::optional<WorkGuard> workGuard_;
    std::promise<void> workerDone_;
    std::future<void> workerFinished_;

    static constexpr std::chrono::seconds CLOSE_TIMEOUT{5};

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> pendingBindings_;
};

} // namespace marketplace::adapters::secondary
