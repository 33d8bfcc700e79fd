#pragma once

#include "domain/errors/ConfigurationError.hpp"
#include <string>
#include <cstdlib>
#include <stdexcept>

namespace magiclink::adapters::secondary::env {

inline std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? value : defaultValue;
}

inline std::string getEnvOrThrow(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw domain::ConfigurationError(std::string("Required env variable not set: ") + name);
    }
    return value;
}

inline int getIntOrDefault(const char* name, int defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw domain::ConfigurationError(std::string("Env variable is not an integer: ") + name);
    }
}

/**
 * @brief PEM в одной строке окружения: литеральные "\n" -> перевод строки
 */
inline std::string unescapeNewlines(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == 'n') {
            result.push_back('\n');
            ++i;
        } else {
            result.push_back(value[i]);
        }
    }
    return result;
}

} // namespace magiclink::adapters::secondary::env
