#include "crypto/Encoding.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <vector>

namespace magiclink::crypto {

namespace {

const char* const kHexDigits = "0123456789abcdef";

int decodeChar(unsigned char c, bool urlAlphabet) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (urlAlphabet) {
        if (c == '-') return 62;
        if (c == '_') return 63;
    } else {
        if (c == '+') return 62;
        if (c == '/') return 63;
    }
    return -1;
}

std::optional<std::string> decodeUnpadded(const std::string& data, bool urlAlphabet) {
    std::string out;
    out.reserve(data.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : data) {
        int value = decodeChar(c, urlAlphabet);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
        buffer &= (1u << bits) - 1;
    }

    // 6 оставшихся бит = длина % 4 == 1, такого кодирования не бывает
    if (bits >= 6) {
        return std::nullopt;
    }
    // Хвостовые биты обязаны быть нулевыми
    if (buffer != 0) {
        return std::nullopt;
    }
    return out;
}

} // namespace

std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::optional<std::string> base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }

    std::string data = text.substr(0, text.size() - padding);
    size_t remainder = data.size() % 4;
    if ((remainder == 0 && padding != 0) ||
        (remainder == 2 && padding != 2) ||
        (remainder == 3 && padding != 1)) {
        return std::nullopt;
    }
    return decodeUnpadded(data, false);
}

std::string base64UrlEncode(const std::string& bytes) {
    std::string encoded = base64Encode(bytes);
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (auto& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return encoded;
}

std::optional<std::string> base64UrlDecode(const std::string& text) {
    return decodeUnpadded(text, true);
}

std::string hexEncode(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(kHexDigits[c >> 4]);
        out.push_back(kHexDigits[c & 0x0F]);
    }
    return out;
}

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t codepoint = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            length = 2;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            codepoint = c & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        // overlong, суррогаты, за пределами Unicode
        if ((length == 2 && codepoint < 0x80) ||
            (length == 3 && codepoint < 0x800) ||
            (length == 4 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace magiclink::crypto
