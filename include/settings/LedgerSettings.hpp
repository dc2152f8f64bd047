#pragma once

#include "settings/PgConnectionSettings.hpp"
#include "settings/StorageBackend.hpp"
#include <optional>

namespace bank::settings {

/**
 * @brief Настройки движка леджера
 *
 * LEDGER_BACKEND: postgres (по умолчанию) | memory.
 * LEDGER_DB_* по умолчанию берутся из BANK_DB_*: в dev-окружении
 * леджер и справочник живут в одной БД.
 */
class LedgerSettings {
public:
    LedgerSettings()
        : backend_(parseStorageBackend(env::orDefault("LEDGER_BACKEND", "postgres")))
    {
        if (backend_ == StorageBackend::POSTGRES) {
            database_.emplace("LEDGER_DB_", "BANK_DB_");
        }
    }

    StorageBackend getBackend() const { return backend_; }

    /**
     * @throws std::logic_error для memory backend
     */
    const PgConnectionSettings& getDatabase() const {
        if (!database_) {
            throw std::logic_error("Ledger backend " + toString(backend_) + " has no database");
        }
        return *database_;
    }

private:
    StorageBackend backend_;
    std::optional<PgConnectionSettings> database_;
};

} // namespace bank::settings
