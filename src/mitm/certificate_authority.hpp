#pragma once

// ---------------------------------------------------------------------------
// certificate_authority.hpp
//
// MITM 루트 CA (ECDSA P-256 키 + 자체 서명 인증서).
//
// [영속화]
// - 두 파일이 모두 있으면 읽고, 키와 인증서가 짝이 맞는지 검증한다.
// - 둘 다 없으면 새로 생성한다. 키는 0600, 인증서는 0644.
//   임시 파일(O_EXCL) → fsync → rename 으로 원자적으로 기록한다.
// - 하나만 있으면 오류. 덮어쓰지 않는다 (운영자가 배포한 CA 보호).
// ---------------------------------------------------------------------------

#include "mitm/openssl_util.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

inline constexpr std::string_view kCaCommonName = "netgate MITM CA";

class CertificateAuthority {
public:
    // generate: 메모리 안에서만 새 CA 를 만든다 (파일 기록 없음)
    [[nodiscard]] static auto generate()
        -> std::expected<std::shared_ptr<const CertificateAuthority>, std::string>;

    [[nodiscard]] static auto load_or_create(const std::filesystem::path& cert_path,
                                             const std::filesystem::path& key_path)
        -> std::expected<std::shared_ptr<const CertificateAuthority>, std::string>;

    CertificateAuthority(const CertificateAuthority&)            = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    [[nodiscard]] X509*     certificate() const noexcept { return cert_.get(); }
    [[nodiscard]] EVP_PKEY* key() const noexcept         { return key_.get(); }

    [[nodiscard]] std::string certificate_pem() const;

private:
    CertificateAuthority(X509Ptr cert, EvpPkeyPtr key);

    X509Ptr    cert_;
    EvpPkeyPtr key_;
};

// write_file_atomic: 같은 디렉터리의 임시 파일에 쓴 뒤 rename
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& path,
                                     std::string_view             content,
                                     std::filesystem::perms       mode)
    -> std::expected<void, std::string>;
