#pragma once

#include <string>
#include <optional>
#include <regex>
#include <algorithm>
#include <cctype>

namespace magiclink::utils {

/**
 * @brief Привести email к каноническому виду: trim + lowercase
 * @return std::nullopt если адрес не похож на email
 */
inline std::optional<std::string> normalizeEmail(const std::string& raw) {
    static const std::regex pattern(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");

    auto begin = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return std::nullopt;
    }

    std::string email(begin, end);
    std::transform(email.begin(), email.end(), email.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Значение идёт в заголовок To: управляющие символы недопустимы
    for (unsigned char c : email) {
        if (c < 0x20 || c == 0x7f) {
            return std::nullopt;
        }
    }

    if (!std::regex_match(email, pattern)) {
        return std::nullopt;
    }
    return email;
}

} // namespace magiclink::utils
