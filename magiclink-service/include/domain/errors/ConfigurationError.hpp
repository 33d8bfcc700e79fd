#pragma once

#include <stdexcept>
#include <string>

namespace magiclink::domain {

/**
 * @brief Отсутствует или некорректна обязательная настройка окружения
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace magiclink::domain
