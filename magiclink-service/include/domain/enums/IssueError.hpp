#pragma once

#include <string>

namespace magiclink::domain {

/**
 * @brief Причина отказа при выпуске magic-link
 */
enum class IssueError {
    NONE,
    INVALID_IDENTITY,
    RATE_LIMITED,
    SIGNING_FAILED,
    TRANSPORT_FAILED
};

inline std::string toString(IssueError error) {
    switch (error) {
        case IssueError::NONE: return "NONE";
        case IssueError::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case IssueError::RATE_LIMITED: return "RATE_LIMITED";
        case IssueError::SIGNING_FAILED: return "SIGNING_FAILED";
        case IssueError::TRANSPORT_FAILED: return "TRANSPORT_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace magiclink::domain
