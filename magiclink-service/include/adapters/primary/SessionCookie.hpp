#pragma once

#include <optional>
#include <string>
#include <chrono>

namespace magiclink::adapters::primary::cookie {

/**
 * @brief Значение Set-Cookie для сессии
 *
 * <name>=<value>; Path=/; Max-Age=<lifetime>; HttpOnly; Secure; SameSite=Lax
 */
inline std::string buildSetCookie(const std::string& name,
                                  const std::string& value,
                                  std::chrono::seconds maxAge) {
    return name + "=" + value +
           "; Path=/; Max-Age=" + std::to_string(maxAge.count()) +
           "; HttpOnly; Secure; SameSite=Lax";
}

/**
 * @brief Set-Cookie, удаляющий cookie на клиенте
 */
inline std::string buildClearCookie(const std::string& name) {
    return name + "=; Path=/; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT"
                  "; HttpOnly; Secure; SameSite=Lax";
}

/**
 * @brief Найти cookie по имени в заголовке Cookie ("a=1; b=2")
 *
 * При повторении имени берётся первое вхождение.
 */
inline std::optional<std::string> findCookie(const std::string& header, const std::string& name) {
    size_t start = 0;
    while (start < header.size()) {
        size_t end = header.find(';', start);
        if (end == std::string::npos) end = header.size();

        std::string pair = header.substr(start, end - start);
        auto first = pair.find_first_not_of(" \t");
        auto last = pair.find_last_not_of(" \t");
        if (first != std::string::npos) {
            pair = pair.substr(first, last - first + 1);
            auto eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name) {
                std::string value = pair.substr(eq + 1);
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                return value;
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace magiclink::adapters::primary::cookie
