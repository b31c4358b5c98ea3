#include "mitm/certificate_authority.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace {

constexpr auto kCaValidity = std::chrono::hours{24 * 365 * 10};

std::expected<std::string, std::string> read_file(const std::filesystem::path& path)
{
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return std::unexpected("cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string errno_message(std::string_view what, const std::filesystem::path& path)
{
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

X509Ptr build_ca_certificate(EVP_PKEY* key)
{
    X509Ptr cert{X509_new()};
    if (!cert) {
        throw SslError("X509_new");
    }
    if (X509_set_version(cert.get(), 2) != 1) {
        throw SslError("X509_set_version");
    }

    set_random_serial(cert.get());
    const auto now = std::chrono::system_clock::now();
    set_validity(cert.get(), now - std::chrono::hours{1}, now + kCaValidity);

    set_common_name(cert.get(), kCaCommonName);
    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(cert.get())) != 1 ||
        X509_set_pubkey(cert.get(), key) != 1)
    {
        throw SslError("X509_set_issuer_name/pubkey");
    }

    add_extension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_extension(cert.get(), cert.get(), NID_key_usage,
                  "critical,keyCertSign,cRLSign,digitalSignature");
    add_extension(cert.get(), cert.get(), NID_subject_key_identifier, "hash");

    if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) {
        throw SslError("X509_sign");
    }
    return cert;
}

}  // namespace

auto write_file_atomic(const std::filesystem::path& path,
                       std::string_view             content,
                       std::filesystem::perms       mode)
    -> std::expected<void, std::string>
{
    const auto tmp = std::filesystem::path{
        fmt::format("{}.{}.tmp", path.string(), static_cast<long>(::getpid()))};
    const auto raw_mode = static_cast<mode_t>(mode);

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, raw_mode);
    if (fd < 0) {
        return std::unexpected(errno_message("cannot create", tmp));
    }

    auto fail = [&](std::string_view what) -> std::expected<void, std::string> {
        auto msg = errno_message(what, tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return std::unexpected(std::move(msg));
    };

    // umask 영향을 받지 않도록 명시적으로 권한 설정
    if (::fchmod(fd, raw_mode) != 0) {
        return fail("fchmod");
    }

    std::size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail("write");
        }
        written += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        return fail("fsync");
    }
    if (::close(fd) != 0) {
        ::unlink(tmp.c_str());
        return std::unexpected(errno_message("close", tmp));
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto msg = errno_message("rename to", path);
        ::unlink(tmp.c_str());
        return std::unexpected(std::move(msg));
    }
    return {};
}

CertificateAuthority::CertificateAuthority(X509Ptr cert, EvpPkeyPtr key)
    : cert_{std::move(cert)}
    , key_{std::move(key)}
{}

std::string CertificateAuthority::certificate_pem() const
{
    return certificate_to_pem(cert_.get());
}

auto CertificateAuthority::generate()
    -> std::expected<std::shared_ptr<const CertificateAuthority>, std::string>
{
    try {
        auto key  = generate_ec_key();
        auto cert = build_ca_certificate(key.get());
        return std::shared_ptr<const CertificateAuthority>(
            new CertificateAuthority(std::move(cert), std::move(key)));
    } catch (const SslError& e) {
        return std::unexpected(std::string{"CA generation failed: "} + e.what());
    }
}

auto CertificateAuthority::load_or_create(const std::filesystem::path& cert_path,
                                          const std::filesystem::path& key_path)
    -> std::expected<std::shared_ptr<const CertificateAuthority>, std::string>
{
    std::error_code ec;
    const bool have_cert = std::filesystem::exists(cert_path, ec);
    const bool have_key  = std::filesystem::exists(key_path, ec);

    if (have_cert != have_key) {
        return std::unexpected(fmt::format(
            "CA material incomplete: {} {}, {} {} (remove the leftover file or restore the pair)",
            cert_path.string(), have_cert ? "exists" : "missing",
            key_path.string(),  have_key  ? "exists" : "missing"));
    }

    if (have_cert) {
        auto cert_pem = read_file(cert_path);
        if (!cert_pem) {
            return std::unexpected(cert_pem.error());
        }
        auto key_pem = read_file(key_path);
        if (!key_pem) {
            return std::unexpected(key_pem.error());
        }

        try {
            auto cert = certificate_from_pem(*cert_pem);
            auto key  = private_key_from_pem(*key_pem);
            if (X509_check_private_key(cert.get(), key.get()) != 1) {
                ERR_clear_error();
                return std::unexpected(fmt::format("CA key {} does not match certificate {}",
                                                   key_path.string(), cert_path.string()));
            }
            spdlog::info("[mitm] loaded CA certificate from {}", cert_path.string());
            return std::shared_ptr<const CertificateAuthority>(
                new CertificateAuthority(std::move(cert), std::move(key)));
        } catch (const SslError& e) {
            return std::unexpected(std::string{"CA load failed: "} + e.what());
        }
    }

    auto created = generate();
    if (!created) {
        return std::unexpected(created.error());
    }

    for (const auto& dir : {cert_path.parent_path(), key_path.parent_path()}) {
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                return std::unexpected(fmt::format("cannot create {}: {}", dir.string(), ec.message()));
            }
        }
    }

    std::string key_pem;
    std::string cert_pem;
    try {
        key_pem  = private_key_to_pem((*created)->key());
        cert_pem = (*created)->certificate_pem();
    } catch (const SslError& e) {
        return std::unexpected(std::string{"CA encoding failed: "} + e.what());
    }

    using std::filesystem::perms;
    if (auto r = write_file_atomic(key_path, key_pem, perms::owner_read | perms::owner_write); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = write_file_atomic(cert_path, cert_pem,
                                   perms::owner_read | perms::owner_write |
                                   perms::group_read | perms::others_read);
        !r)
    {
        return std::unexpected(r.error());
    }

    spdlog::info("[mitm] generated new CA: cert={} key={}", cert_path.string(), key_path.string());
    return created;
}
