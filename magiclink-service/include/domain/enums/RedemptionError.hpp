#pragma once

#include <string>

namespace magiclink::domain {

/**
 * @brief Причина отказа при погашении токена
 *
 * Внутренняя деталь: наружу отдаётся только INVALID_OR_EXPIRED_LINK.
 */
enum class RedemptionError {
    NONE,
    NOT_FOUND,
    EXPIRED,
    ALREADY_CONSUMED
};

inline std::string toString(RedemptionError error) {
    switch (error) {
        case RedemptionError::NONE: return "NONE";
        case RedemptionError::NOT_FOUND: return "NOT_FOUND";
        case RedemptionError::EXPIRED: return "EXPIRED";
        case RedemptionError::ALREADY_CONSUMED: return "ALREADY_CONSUMED";
        default: return "UNKNOWN";
    }
}

} // namespace magiclink::domain
