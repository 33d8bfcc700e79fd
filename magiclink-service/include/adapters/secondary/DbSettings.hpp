#pragma once

#include "Env.hpp"
#include <string>

namespace magiclink::adapters::secondary {

/**
 * @brief Настройки хранилища токенов из ENV
 *
 * MAGICLINK_STORAGE=memory включает хранилище в памяти (локальный запуск),
 * тогда параметры подключения к БД не требуются.
 */
class DbSettings {
public:
    DbSettings() {
        storage_ = env::getEnvOrDefault("MAGICLINK_STORAGE", "postgres");
        if (storage_ != "postgres" && storage_ != "memory") {
            throw domain::ConfigurationError("MAGICLINK_STORAGE must be 'postgres' or 'memory'");
        }
        host_ = env::getEnvOrDefault("MAGICLINK_DB_HOST", "localhost");
        port_ = env::getIntOrDefault("MAGICLINK_DB_PORT", 5432);
        name_ = env::getEnvOrDefault("MAGICLINK_DB_NAME", "magiclink_db");
        user_ = env::getEnvOrDefault("MAGICLINK_DB_USER", "magiclink_user");
        if (usePostgres()) {
            password_ = env::getEnvOrThrow("MAGICLINK_DB_PASSWORD");
        }
    }

    std::string getStorage() const { return storage_; }
    bool usePostgres() const { return storage_ == "postgres"; }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string storage_;
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
};

} // namespace magiclink::adapters::secondary
