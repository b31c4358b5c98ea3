#include "mitm/leaf_cert_issuer.hpp"
#include "policy/domain_matcher.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/ip/address.hpp>

#include <openssl/x509v3.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

// SAN 설정 문자열에 그대로 들어가므로 구분자(',', ':')가 섞이면 안 된다
bool is_valid_dns_name(std::string_view host)
{
    if (host.empty() || host.size() > 253) {
        return false;
    }
    return std::all_of(host.begin(), host.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
    });
}

}  // namespace

LeafCertIssuer::LeafCertIssuer(std::shared_ptr<const CertificateAuthority> ca,
                               std::chrono::hours                          validity,
                               Clock                                       clock)
    : ca_{std::move(ca)}
    , validity_{validity}
    , clock_{std::move(clock)}
{}

bool LeafCertIssuer::needs_renewal(const LeafCertificate&                leaf,
                                   std::chrono::system_clock::time_point now) const
{
    return now + validity_ / 10 >= leaf.not_after;
}

std::shared_ptr<const LeafCertificate>
LeafCertIssuer::build(const std::string& host, std::chrono::system_clock::time_point now) const
{
    boost::system::error_code ec;
    const auto ip = boost::asio::ip::make_address(host, ec);
    const std::string san = ec ? "DNS:" + host : "IP:" + ip.to_string();

    auto key = generate_ec_key();

    X509Ptr cert{X509_new()};
    if (!cert) {
        throw SslError("X509_new");
    }
    if (X509_set_version(cert.get(), 2) != 1) {
        throw SslError("X509_set_version");
    }
    set_random_serial(cert.get());

    const auto not_after_tp = now + validity_;
    set_validity(cert.get(), now - std::chrono::hours{1}, not_after_tp);

    set_common_name(cert.get(), host);
    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(ca_->certificate())) != 1 ||
        X509_set_pubkey(cert.get(), key.get()) != 1)
    {
        throw SslError("X509_set_issuer_name/pubkey");
    }

    add_extension(cert.get(), ca_->certificate(), NID_basic_constraints, "critical,CA:FALSE");
    add_extension(cert.get(), ca_->certificate(), NID_key_usage,
                  "critical,digitalSignature,keyEncipherment");
    add_extension(cert.get(), ca_->certificate(), NID_ext_key_usage, "serverAuth");
    add_extension(cert.get(), ca_->certificate(), NID_subject_alt_name, san);
    add_extension(cert.get(), ca_->certificate(), NID_authority_key_identifier, "keyid:always");

    if (X509_sign(cert.get(), ca_->key(), EVP_sha256()) <= 0) {
        throw SslError("X509_sign");
    }

    // 캐시 갱신 판정은 인증서에 실제 기록된 값(초 단위 절삭)을 기준으로 한다
    const auto recorded = not_after(cert.get());
    return std::make_shared<const LeafCertificate>(LeafCertificate{
        .cert      = std::move(cert),
        .key       = std::move(key),
        .not_after = recorded,
    });
}

auto LeafCertIssuer::issue(std::string_view raw_host)
    -> std::expected<std::shared_ptr<const LeafCertificate>, std::string>
{
    const std::string host = normalize_host(raw_host);

    boost::system::error_code ec;
    (void)boost::asio::ip::make_address(host, ec);
    if (ec && !is_valid_dns_name(host)) {
        return std::unexpected("invalid host for leaf certificate: " + std::string{raw_host});
    }

    const auto now = clock_();
    {
        std::lock_guard lock{cache_mutex_};
        const auto it = cache_.find(host);
        if (it != cache_.end() && !needs_renewal(*it->second, now)) {
            return it->second;
        }
    }

    std::shared_ptr<const LeafCertificate> leaf;
    try {
        leaf = build(host, now);
    } catch (const SslError& e) {
        return std::unexpected(fmt::format("leaf issuance for {} failed: {}", host, e.what()));
    }

    spdlog::debug("[mitm] issued leaf certificate for {}", host);
    {
        std::lock_guard lock{cache_mutex_};
        cache_[host] = leaf;
    }
    return leaf;
}

std::size_t LeafCertIssuer::cache_size() const
{
    std::lock_guard lock{cache_mutex_};
    return cache_.size();
}
