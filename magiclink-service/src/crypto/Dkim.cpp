#include "crypto/Dkim.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Encoding.hpp"
#include "domain/errors/SigningError.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>

namespace magiclink::crypto::dkim {

namespace {

const char* const kSignatureHeader = "DKIM-Signature";

bool isWsp(char c) {
    return c == ' ' || c == '\t';
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

std::string trimWsp(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && isWsp(value[begin])) ++begin;
    while (end > begin && isWsp(value[end - 1])) --end;
    return value.substr(begin, end - begin);
}

std::string collapseWsp(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool inWsp = false;
    for (char c : value) {
        if (isWsp(c)) {
            if (!inWsp) {
                out.push_back(' ');
            }
            inWsp = true;
        } else {
            out.push_back(c);
            inWsp = false;
        }
    }
    return out;
}

std::string removeWsp(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (!isWsp(c) && c != '\r' && c != '\n') {
            out.push_back(c);
        }
    }
    return out;
}

void validateTag(const std::string& tag, const std::string& what) {
    if (tag.empty()) {
        throw domain::SigningError("DKIM " + what + " is empty");
    }
    for (unsigned char c : tag) {
        if (!std::isalnum(c) && c != '.' && c != '-' && c != '_') {
            throw domain::SigningError("DKIM " + what + " contains invalid character");
        }
    }
}

void validateHeader(const domain::MailHeader& header) {
    if (header.name.empty()) {
        throw domain::SigningError("Empty header name");
    }
    for (unsigned char c : header.name) {
        if (c < 33 || c > 126 || c == ':') {
            throw domain::SigningError("Header name is not printable ASCII: " + header.name);
        }
    }
    if (!isValidUtf8(header.value)) {
        throw domain::SigningError("Header value is not valid UTF-8: " + header.name);
    }
    // CR/LF допустимы только как folding: CRLF + WSP
    const auto& v = header.value;
    for (size_t i = 0; i < v.size(); ++i) {
        if (v[i] == '\r') {
            if (i + 2 >= v.size() || v[i + 1] != '\n' || !isWsp(v[i + 2])) {
                throw domain::SigningError("Bare CR/LF in header value: " + header.name);
            }
            ++i;
        } else if (v[i] == '\n') {
            throw domain::SigningError("Bare LF in header value: " + header.name);
        }
    }
}

void validateBody(const std::string& body) {
    if (!isValidUtf8(body)) {
        throw domain::SigningError("Message body is not valid UTF-8");
    }
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\r' && (i + 1 >= body.size() || body[i + 1] != '\n')) {
            throw domain::SigningError("Bare CR in message body");
        }
    }
}

/**
 * @brief Выбрать подписываемые заголовки: для повторяющегося имени берём последний
 */
std::vector<const domain::MailHeader*> selectSignedHeaders(const domain::MailHeaders& headers) {
    std::vector<const domain::MailHeader*> selected;
    for (const auto& name : signedHeaderOrder()) {
        auto it = std::find_if(headers.rbegin(), headers.rend(),
                               [&](const domain::MailHeader& h) { return iequals(h.name, name); });
        if (it != headers.rend()) {
            selected.push_back(&*it);
        }
    }
    return selected;
}

struct Tag {
    std::string name;
    std::string value;
};

std::vector<Tag> parseTags(const std::string& value) {
    std::vector<Tag> tags;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(';', start);
        if (end == std::string::npos) end = value.size();

        std::string item = value.substr(start, end - start);
        auto eq = item.find('=');
        if (eq != std::string::npos) {
            tags.push_back({removeWsp(item.substr(0, eq)), trimWsp(item.substr(eq + 1))});
        } else if (!removeWsp(item).empty()) {
            tags.push_back({removeWsp(item), ""});
        }
        start = end + 1;
    }
    return tags;
}

std::optional<std::string> findTag(const std::vector<Tag>& tags, const std::string& name) {
    for (const auto& tag : tags) {
        if (tag.name == name) return tag.value;
    }
    return std::nullopt;
}

/**
 * @brief Значение DKIM-Signature с пустым b= (всё остальное без изменений)
 */
std::string stripSignatureValue(const std::string& value) {
    size_t start = 0;
    while (start < value.size()) {
        size_t end = value.find(';', start);
        if (end == std::string::npos) end = value.size();

        auto eq = value.find('=', start);
        if (eq != std::string::npos && eq < end &&
            removeWsp(value.substr(start, eq - start)) == "b") {
            return value.substr(0, eq + 1) + value.substr(end);
        }
        start = end + 1;
    }
    return value;
}

std::string joinNames(const std::vector<const domain::MailHeader*>& headers) {
    std::string joined;
    for (const auto* header : headers) {
        if (!joined.empty()) joined += ":";
        joined += toLower(header->name);
    }
    return joined;
}

} // namespace

const std::vector<std::string>& signedHeaderOrder() {
    static const std::vector<std::string> order = {
        "from", "to", "subject", "date", "message-id", "mime-version", "content-type"
    };
    return order;
}

std::string canonicalizeBodyRelaxed(const std::string& body) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\r' && i + 1 < body.size() && body[i + 1] == '\n') {
            continue;
        }
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        lines.push_back(current);
    }

    for (auto& line : lines) {
        line = collapseWsp(line);
        while (!line.empty() && line.back() == ' ') {
            line.pop_back();
        }
    }

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::string canonical;
    for (const auto& line : lines) {
        canonical += line;
        canonical += "\r\n";
    }
    return canonical;
}

std::string canonicalizeHeaderRelaxed(const std::string& name, const std::string& value) {
    std::string unfolded;
    unfolded.reserve(value.size());
    for (char c : value) {
        if (c != '\r' && c != '\n') {
            unfolded.push_back(c);
        }
    }
    return toLower(trimWsp(name)) + ":" + trimWsp(collapseWsp(unfolded));
}

std::string bodyHash(const std::string& body) {
    return base64Encode(sha256(canonicalizeBodyRelaxed(body)));
}

std::string sign(const domain::MailHeaders& headers,
                 const std::string& body,
                 const RsaPrivateKey& privateKey,
                 const std::string& domain,
                 const std::string& selector,
                 std::chrono::system_clock::time_point timestamp) {
    validateSigningDomain(domain, selector);
    for (const auto& header : headers) {
        validateHeader(header);
    }
    validateBody(body);

    auto signedHeaders = selectSignedHeaders(headers);
    if (signedHeaders.empty() || !iequals(signedHeaders.front()->name, "from")) {
        throw domain::SigningError("From header is required for DKIM");
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        timestamp.time_since_epoch()).count();

    std::string value =
        "v=1; a=rsa-sha256; c=relaxed/relaxed; d=" + domain +
        "; s=" + selector +
        "; t=" + std::to_string(seconds) +
        "; h=" + joinNames(signedHeaders) +
        "; bh=" + bodyHash(body) +
        "; b=";

    std::string signingInput;
    for (const auto* header : signedHeaders) {
        signingInput += canonicalizeHeaderRelaxed(header->name, header->value);
        signingInput += "\r\n";
    }
    signingInput += canonicalizeHeaderRelaxed(kSignatureHeader, value);

    return value + base64Encode(privateKey.signSha256(signingInput));
}

VerifyResult verify(const domain::MailHeaders& headers,
                    const std::string& body,
                    const RsaPublicKey& publicKey) {
    VerifyResult result;

    auto sigIt = std::find_if(headers.begin(), headers.end(),
                              [](const domain::MailHeader& h) { return iequals(h.name, kSignatureHeader); });
    if (sigIt == headers.end()) {
        result.message = "No DKIM-Signature header";
        return result;
    }

    auto tags = parseTags(sigIt->value);
    auto version = findTag(tags, "v");
    auto algorithm = findTag(tags, "a");
    auto canonicalization = findTag(tags, "c");
    auto d = findTag(tags, "d");
    auto s = findTag(tags, "s");
    auto h = findTag(tags, "h");
    auto bh = findTag(tags, "bh");
    auto b = findTag(tags, "b");

    if (!version || *version != "1" || !d || !s || !h || !bh || !b) {
        result.message = "Malformed DKIM-Signature";
        return result;
    }
    if (!algorithm || *algorithm != "rsa-sha256") {
        result.message = "Unsupported algorithm";
        return result;
    }
    if (!canonicalization || *canonicalization != "relaxed/relaxed") {
        result.message = "Unsupported canonicalization";
        return result;
    }

    result.domain = *d;
    result.selector = *s;

    if (bodyHash(body) != removeWsp(*bh)) {
        result.message = "Body hash mismatch";
        return result;
    }

    // Одноимённые заголовки берутся снизу вверх (RFC 6376 §5.4.2)
    std::map<std::string, size_t> used;
    std::string signingInput;
    size_t start = 0;
    std::string names = removeWsp(*h);
    while (start <= names.size()) {
        size_t end = names.find(':', start);
        if (end == std::string::npos) end = names.size();
        std::string name = toLower(names.substr(start, end - start));
        start = end + 1;
        if (name.empty()) continue;

        size_t skip = used[name]++;
        for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
            if (&*it == &*sigIt || !iequals(it->name, name)) continue;
            if (skip-- == 0) {
                signingInput += canonicalizeHeaderRelaxed(it->name, it->value);
                signingInput += "\r\n";
                break;
            }
        }
    }
    signingInput += canonicalizeHeaderRelaxed(sigIt->name, stripSignatureValue(sigIt->value));

    auto signature = base64Decode(removeWsp(*b));
    if (!signature) {
        result.message = "Signature is not valid base64";
        return result;
    }

    result.valid = publicKey.verifySha256(signingInput, *signature);
    result.message = result.valid ? "pass" : "Signature mismatch";
    return result;
}

void validateSigningDomain(const std::string& domain, const std::string& selector) {
    validateTag(domain, "domain");
    validateTag(selector, "selector");
}

std::string foldSignature(const std::string& value) {
    const size_t chunk = 72;
    std::string folded;
    size_t start = 0;
    while (start < value.size()) {
        size_t end = value.find("; ", start);
        std::string item = value.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (!folded.empty()) {
            folded += ";\r\n ";
        }
        if (item.compare(0, 2, "b=") == 0 && item.size() > 2 + chunk) {
            folded += "b=";
            for (size_t pos = 2; pos < item.size(); pos += chunk) {
                if (pos > 2) folded += "\r\n ";
                folded += item.substr(pos, chunk);
            }
        } else {
            folded += item;
        }

        if (end == std::string::npos) break;
        start = end + 2;
    }
    return folded;
}

std::string dnsRecord(const RsaPublicKey& publicKey) {
    return "v=DKIM1; k=rsa; p=" + base64Encode(publicKey.der());
}

} // namespace magiclink::crypto::dkim
