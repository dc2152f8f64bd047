#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string>

namespace bank::utils {

/**
 * @brief Генератор UUID v4
 *
 * Централизованная утилита для генерации 128-битных идентификаторов
 * (идентичности пользователей и одноразовые ID операций).
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4
     */
    static boost::uuids::uuid generate() {
        thread_local boost::uuids::random_generator gen;
        return gen();
    }

    /**
     * @brief Генерирует UUID v4 в строковом формате
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generateString() {
        return boost::uuids::to_string(generate());
    }
};

} // namespace bank::utils
