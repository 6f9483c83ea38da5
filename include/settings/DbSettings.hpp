// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace marketplace::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает из ENV:
 * - MARKETPLACE_DB_HOST (default: "marketplace-postgres")
 * - MARKETPLACE_DB_PORT (default: 5432)
 * - MARKETPLACE_DB_NAME (default: "marketplace_db")
 * - MARKETPLACE_DB_USER (default: "marketplace_user")
 * - MARKETPLACE_DB_PASSWORD
 *
 * Каждая транзакция PostgresOrderStore открывает своё соединение
 * по getConnectionString().
 */
class DbSettings {
public:
    DbSettings() {
        if (const char* host = std::getenv("MARKETPLACE_DB_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("MARKETPLACE_DB_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* name = std::getenv("MARKETPLACE_DB_NAME")) {
            name_ = name;
        }
        if (const char* user = std::getenv("MARKETPLACE_DB_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("MARKETPLACE_DB_PASSWORD")) {
            password_ = password;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }

    /**
     * @brief Строка подключения libpqxx ("host=... port=... dbname=...")
     */
    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_ = "marketplace-postgres";
    int port_ = 5432;
    std::string name_ = "marketplace_db";
    std::string user_ = "marketplace_user";
    std::string password_ = "marketplace_secret_password";
};

} // namespace marketplace::settings
