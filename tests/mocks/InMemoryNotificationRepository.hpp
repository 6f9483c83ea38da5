#pragma once

#include "ports/output/INotificationRepository.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>

namespace marketplace::tests::mocks {

/**
 * @brief In-Memory реализация репозитория уведомлений для unit-тестов
 */
class InMemoryNotificationRepository : public ports::output::INotificationRepository {
public:
    domain::Notification save(const domain::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            throw std::runtime_error("notifications table unavailable");
        }
        domain::Notification saved = notification;
        saved.id = "notif-" + std::to_string(notifications_.size() + 1);
        notifications_.push_back(saved);
        return saved;
    }

    // Test helpers
    std::vector<domain::Notification> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_.size();
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::Notification> notifications_;
    bool failing_ = false;
};

} // namespace marketplace::tests::mocks
