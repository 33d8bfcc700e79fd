#pragma once

#include <string>

namespace magiclink::crypto {

/// SHA-256, 32 сырых байта
std::string sha256(const std::string& data);

/// SHA-256 в hex (64 символа)
std::string sha256Hex(const std::string& data);

/// HMAC-SHA256, 32 сырых байта
std::string hmacSha256(const std::string& key, const std::string& data);

/**
 * @brief Сравнение за время, не зависящее от содержимого
 *
 * Длины считаются публичными: при разной длине сразу false.
 */
bool constantTimeEquals(const std::string& a, const std::string& b);

/**
 * @brief Криптостойкие случайные байты (RAND_bytes)
 * @throws std::runtime_error если генератор не готов
 */
std::string randomBytes(size_t count);

} // namespace magiclink::crypto
