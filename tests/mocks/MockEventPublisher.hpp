#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <vector>
#include <string>

namespace marketplace::tests::mocks {

/**
 * @brief Mock реализация IEventPublisher для тестов
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
    };

    const std::vector<PublishedMessage>& getPublishedMessages() const {
        return messages_;
    }

    int publishCallCount() const { return static_cast<int>(messages_.size()); }

    void publish(const std::string& routingKey, const std::string& message) override {
        messages_.push_back({routingKey, message});
    }

private:
    std::vector<PublishedMessage> messages_;
};

} // namespace marketplace::tests::mocks
