#pragma once

#include "settings/PgConnectionSettings.hpp"
#include "settings/StorageBackend.hpp"
#include <optional>

namespace bank::settings {

/**
 * @brief Настройки справочника пользователей
 *
 * DIRECTORY_BACKEND: postgres (по умолчанию) | memory.
 * Для postgres читаются BANK_DB_*, BANK_DB_PASSWORD обязателен.
 */
class DirectorySettings {
public:
    DirectorySettings()
        : backend_(parseStorageBackend(env::orDefault("DIRECTORY_BACKEND", "postgres")))
    {
        if (backend_ == StorageBackend::POSTGRES) {
            database_.emplace("BANK_DB_");
        }
    }

    StorageBackend getBackend() const { return backend_; }

    /**
     * @throws std::logic_error для memory backend
     */
    const PgConnectionSettings& getDatabase() const {
        if (!database_) {
            throw std::logic_error("Directory backend " + toString(backend_) + " has no database");
        }
        return *database_;
    }

private:
    StorageBackend backend_;
    std::optional<PgConnectionSettings> database_;
};

} // namespace bank::settings
