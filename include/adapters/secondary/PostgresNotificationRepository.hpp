// include/adapters/secondary/PostgresNotificationRepository.hpp
#pragma once

#include "ports/output/INotificationRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace marketplace::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий уведомлений
 *
 * Таблица: notifications
 * - id VARCHAR(64) PRIMARY KEY
 * - user_id VARCHAR(64) NOT NULL
 * - type VARCHAR(32) NOT NULL ('order_status', 'low_stock')
 * - title, message TEXT NOT NULL
 * - data JSONB
 * - is_read BOOLEAN DEFAULT FALSE
 * - created_at TIMESTAMP DEFAULT NOW()
 */
class PostgresNotificationRepository : public ports::output::INotificationRepository {
public:
    explicit PostgresNotificationRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    domain::Notification save(const domain::Notification& notification) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO notifications (user_id, type, title, message, data, is_read) "
                "VALUES ($1, $2, $3, $4, $5::jsonb, $6) "
                "RETURNING id, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at",
                notification.userId,
                domain::toString(notification.type),
                notification.title,
                notification.message,
                notification.data.dump(),
                notification.isRead
            );

            txn.commit();

            domain::Notification saved = notification;
            saved.id = result[0]["id"].as<std::string>();
            saved.createdAt = domain::Timestamp::fromEpochSeconds(result[0]["created_at"].as<int64_t>());

            std::cout << "[PostgresNotificationRepository] Saved " << domain::toString(saved.type)
                      << " for user " << saved.userId << std::endl;
            return saved;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresNotificationRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS notifications (
                    id VARCHAR(64) PRIMARY KEY DEFAULT gen_random_uuid()::text,
                    user_id VARCHAR(64) NOT NULL,
                    type VARCHAR(32) NOT NULL,
                    title TEXT NOT NULL,
                    message TEXT NOT NULL,
                    data JSONB,
                    is_read BOOLEAN NOT NULL DEFAULT FALSE,
                    created_at TIMESTAMP NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_notifications_user_id ON notifications(user_id)");

            txn.commit();
            std::cout << "[PostgresNotificationRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresNotificationRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace marketplace::adapters::secondary
