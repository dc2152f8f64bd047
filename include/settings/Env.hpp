#pragma once

#include <string>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace bank::settings::env {

inline std::optional<std::string> lookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

inline std::string orDefault(const std::string& name, const std::string& defaultValue) {
    return lookup(name).value_or(defaultValue);
}

/**
 * @brief Значение первой заданной переменной из пары name / fallbackName
 *
 * Пустой fallbackName отключает запасную переменную.
 */
inline std::optional<std::string> lookupWithFallback(const std::string& name, const std::string& fallbackName) {
    if (auto value = lookup(name)) return value;
    if (fallbackName.empty()) return std::nullopt;
    return lookup(fallbackName);
}

/**
 * @throws std::runtime_error если ни одна из переменных не задана
 */
inline std::string required(const std::string& name, const std::string& fallbackName = "") {
    if (auto value = lookupWithFallback(name, fallbackName)) return *value;
    std::string names = fallbackName.empty() ? name : name + " or " + fallbackName;
    throw std::runtime_error("Required env variable not set: " + names);
}

} // namespace bank::settings::env
