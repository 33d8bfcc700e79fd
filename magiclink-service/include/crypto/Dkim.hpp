#pragma once

#include "crypto/RsaKey.hpp"
#include "domain/MailHeader.hpp"

#include <chrono>
#include <string>
#include <vector>

/**
 * @file Dkim.hpp
 * @brief DKIM (RFC 6376), профиль rsa-sha256 + relaxed/relaxed
 *
 * Чистые функции без I/O: подпись можно проверять на эталонных векторах
 * без почтового сервера и DNS.
 */

namespace magiclink::crypto::dkim {

/**
 * @brief Заголовки, которые подписываются, в фиксированном порядке
 *
 * Отсутствующие в письме пропускаются. From обязателен.
 */
const std::vector<std::string>& signedHeaderOrder();

/**
 * @brief Relaxed канонизация тела (RFC 6376 §3.4.4)
 *
 * LF -> CRLF, серии WSP -> один SP, WSP в конце строк удаляется,
 * пустые строки в конце тела удаляются. Непустой результат заканчивается CRLF.
 */
std::string canonicalizeBodyRelaxed(const std::string& body);

/**
 * @brief Relaxed канонизация одного заголовка (RFC 6376 §3.4.2), без CRLF
 */
std::string canonicalizeHeaderRelaxed(const std::string& name, const std::string& value);

/// base64(SHA-256(relaxed body)), значение тега bh=
std::string bodyHash(const std::string& body);

/**
 * @brief Построить значение заголовка DKIM-Signature
 *
 * Результат детерминирован для одинаковых входных данных (включая timestamp).
 *
 * @param headers Заголовки письма (без DKIM-Signature)
 * @param body Тело письма
 * @param privateKey Ключ подписи
 * @param domain Тег d=
 * @param selector Тег s=
 * @param timestamp Тег t=
 * @return Значение заголовка: "v=1; a=rsa-sha256; ...; b=<подпись>"
 * @throws domain::SigningError если ключ битый или содержимое нельзя канонизировать
 */
std::string sign(const domain::MailHeaders& headers,
                 const std::string& body,
                 const RsaPrivateKey& privateKey,
                 const std::string& domain,
                 const std::string& selector,
                 std::chrono::system_clock::time_point timestamp);

struct VerifyResult {
    bool valid = false;
    std::string domain;
    std::string selector;
    std::string message;
};

/**
 * @brief Проверка подписи на стороне получателя
 *
 * Поддерживается только то, что выпускает sign(): a=rsa-sha256, c=relaxed/relaxed.
 * Ключ передаётся явно вместо DNS-запроса.
 */
VerifyResult verify(const domain::MailHeaders& headers,
                    const std::string& body,
                    const RsaPublicKey& publicKey);

/**
 * @brief Проверка тегов d= и s=: непустые, только [A-Za-z0-9.-_]
 * @throws domain::SigningError
 */
void validateSigningDomain(const std::string& domain, const std::string& selector);

/**
 * @brief Перенос значения DKIM-Signature (CRLF + SP) по границам тегов
 *
 * b= дополнительно режется на строки по 72 символа. Relaxed канонизация
 * и verify() переносы игнорируют.
 */
std::string foldSignature(const std::string& value);

/**
 * @brief TXT запись для <selector>._domainkey.<domain>
 */
std::string dnsRecord(const RsaPublicKey& publicKey);

} // namespace magiclink::crypto::dkim
