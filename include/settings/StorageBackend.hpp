#pragma once

#include <string>
#include <stdexcept>

namespace bank::settings {

/**
 * @brief Реализация хранилища, выбираемая через ENV
 */
enum class StorageBackend {
    POSTGRES,
    MEMORY
};

inline std::string toString(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::POSTGRES: return "postgres";
        case StorageBackend::MEMORY:   return "memory";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument для неизвестного значения
 */
inline StorageBackend parseStorageBackend(const std::string& str) {
    if (str == "postgres") return StorageBackend::POSTGRES;
    if (str == "memory")   return StorageBackend::MEMORY;
    throw std::invalid_argument("Unknown storage backend: " + str);
}

} // namespace bank::settings
