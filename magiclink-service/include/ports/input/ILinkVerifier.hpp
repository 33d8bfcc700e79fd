#pragma once

#include "domain/enums/VerifyError.hpp"
#include <string>

namespace magiclink::ports::input {

/**
 * @brief Результат перехода по ссылке
 */
struct VerifyLinkResult {
    bool success;
    std::string identity;
    std::string cookieValue;
    domain::VerifyError error;
};

/**
 * @brief Погашение ссылки и открытие сессии
 */
class ILinkVerifier {
public:
    virtual ~ILinkVerifier() = default;

    virtual VerifyLinkResult verify(const std::string& identifier) = 0;
};

} // namespace magiclink::ports::input
