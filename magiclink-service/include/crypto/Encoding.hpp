#pragma once

#include <string>
#include <optional>

namespace magiclink::crypto {

/**
 * @brief Base64 (RFC 4648 §4) с паддингом
 */
std::string base64Encode(const std::string& bytes);

/**
 * @brief Строгое декодирование Base64
 *
 * Отклоняет посторонние символы, неверный паддинг и неканонические
 * хвостовые биты. Пробелы и переводы строк не допускаются.
 */
std::optional<std::string> base64Decode(const std::string& text);

/**
 * @brief Base64url (RFC 4648 §5) без паддинга
 */
std::string base64UrlEncode(const std::string& bytes);

/**
 * @brief Строгое декодирование base64url без паддинга
 *
 * Для любой строки s: если decode(s) успешен, то encode(decode(s)) == s.
 * Поэтому изменение любого бита закодированного значения либо ломает
 * декодирование, либо меняет сами байты.
 */
std::optional<std::string> base64UrlDecode(const std::string& text);

std::string hexEncode(const std::string& bytes);

bool isValidUtf8(const std::string& text);

} // namespace magiclink::crypto
