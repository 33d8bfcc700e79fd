#pragma once

#include <string>
#include <vector>

namespace magiclink::domain {

struct MailHeader {
    std::string name;
    std::string value;
};

using MailHeaders = std::vector<MailHeader>;

} // namespace magiclink::domain
