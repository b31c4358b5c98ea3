#pragma once

// ---------------------------------------------------------------------------
// leaf_cert_issuer.hpp
//
// 호스트별 단기 leaf 인증서 발급기 + 캐시.
//
// [갱신 규칙]
// notBefore = now - 1h, notAfter = now + validity.
// now + validity/10 >= notAfter 이면 캐시 항목을 새로 발급한다.
//
// [동시성]
// cache_mutex_ 는 조회와 삽입에만 잡는다. 키 생성과 서명은 락 밖에서 수행한다.
// 같은 호스트를 동시에 요청하면 중복 발급될 수 있으며 나중 것이 캐시에 남는다.
// ---------------------------------------------------------------------------

#include "mitm/certificate_authority.hpp"
#include "mitm/openssl_util.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

struct LeafCertificate {
    X509Ptr                               cert;
    EvpPkeyPtr                            key;
    std::chrono::system_clock::time_point not_after{};
};

class LeafCertIssuer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    LeafCertIssuer(std::shared_ptr<const CertificateAuthority> ca,
                   std::chrono::hours                          validity,
                   Clock                                       clock = [] { return std::chrono::system_clock::now(); });

    LeafCertIssuer(const LeafCertIssuer&)            = delete;
    LeafCertIssuer& operator=(const LeafCertIssuer&) = delete;

    // issue: 캐시에 유효한 항목이 있으면 그것을, 없거나 갱신 대상이면 새로 발급한다.
    //   host 는 DNS 이름 또는 IP 리터럴. 허용되지 않는 문자가 있으면 오류.
    [[nodiscard]] auto issue(std::string_view host)
        -> std::expected<std::shared_ptr<const LeafCertificate>, std::string>;

    [[nodiscard]] std::size_t cache_size() const;

    [[nodiscard]] const CertificateAuthority& authority() const noexcept { return *ca_; }

private:
    [[nodiscard]] bool needs_renewal(const LeafCertificate&                leaf,
                                     std::chrono::system_clock::time_point now) const;

    [[nodiscard]] std::shared_ptr<const LeafCertificate> build(const std::string&                    host,
                                                               std::chrono::system_clock::time_point now) const;

    std::shared_ptr<const CertificateAuthority> ca_;
    std::chrono::hours                          validity_;
    Clock                                       clock_;

    mutable std::mutex                                                      cache_mutex_{};
    std::unordered_map<std::string, std::shared_ptr<const LeafCertificate>> cache_{};
};
