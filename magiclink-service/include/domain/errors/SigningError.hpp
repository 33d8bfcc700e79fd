#pragma once

#include <stdexcept>
#include <string>

namespace magiclink::domain {

/**
 * @brief Ошибка DKIM-подписи: битый ключ или неканонизируемое содержимое
 */
class SigningError : public std::runtime_error {
public:
    explicit SigningError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace magiclink::domain
