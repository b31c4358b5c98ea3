#pragma once

// ---------------------------------------------------------------------------
// openssl_util.hpp
//
// OpenSSL C API 를 위한 RAII 래퍼와 헬퍼.
//
// [오류 처리]
// 헬퍼는 실패 시 SslError 를 던진다. 메시지에는 OpenSSL 오류 큐 내용이
// 포함되며 큐는 비워진다. CertificateAuthority / LeafCertIssuer 가 경계에서
// 잡아 std::unexpected 로 변환한다.
// ---------------------------------------------------------------------------

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

struct EvpPkeyDeleter     { void operator()(EVP_PKEY* p) const noexcept     { EVP_PKEY_free(p); } };
struct EvpPkeyCtxDeleter  { void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); } };
struct X509Deleter        { void operator()(X509* p) const noexcept         { X509_free(p); } };
struct X509ExtDeleter     { void operator()(X509_EXTENSION* p) const noexcept { X509_EXTENSION_free(p); } };
struct BioDeleter         { void operator()(BIO* p) const noexcept          { BIO_free_all(p); } };

using EvpPkeyPtr    = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using X509Ptr       = std::unique_ptr<X509, X509Deleter>;
using X509ExtPtr    = std::unique_ptr<X509_EXTENSION, X509ExtDeleter>;
using BioPtr        = std::unique_ptr<BIO, BioDeleter>;

class SslError : public std::runtime_error {
public:
    // what = "<context>: <오류 큐>"
    explicit SslError(std::string_view context);
};

// drain_ssl_errors: 오류 큐를 "; " 로 이어 붙여 반환하고 비운다
[[nodiscard]] std::string drain_ssl_errors();

// generate_ec_key: ECDSA P-256 키 쌍
[[nodiscard]] EvpPkeyPtr generate_ec_key();

[[nodiscard]] std::string certificate_to_pem(X509* cert);
[[nodiscard]] std::string private_key_to_pem(EVP_PKEY* key);  // PKCS#8, 암호화 없음

[[nodiscard]] X509Ptr    certificate_from_pem(std::string_view pem);
[[nodiscard]] EvpPkeyPtr private_key_from_pem(std::string_view pem);

// add_extension: "critical,CA:TRUE" 같은 v3 설정 문자열로 확장을 추가한다
void add_extension(X509* cert, X509* issuer, int nid, const std::string& value);

// set_random_serial: 159비트 양수 난수 일련번호
void set_random_serial(X509* cert);

void set_validity(X509*                                 cert,
                  std::chrono::system_clock::time_point not_before,
                  std::chrono::system_clock::time_point not_after);

[[nodiscard]] std::chrono::system_clock::time_point not_after(const X509* cert);

// set_common_name: subject CN 설정 (64자 초과면 생략)
void set_common_name(X509* cert, std::string_view common_name);
