#include "mitm/openssl_util.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509v3.h>

#include <array>
#include <ctime>

namespace {

BioPtr memory_bio(std::string_view data)
{
    BioPtr bio{BIO_new_mem_buf(data.data(), static_cast<int>(data.size()))};
    if (!bio) {
        throw SslError("BIO_new_mem_buf");
    }
    return bio;
}

std::string read_bio(BIO* bio)
{
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (mem == nullptr) {
        throw SslError("BIO_get_mem_ptr");
    }
    return std::string{mem->data, mem->length};
}

}  // namespace

std::string drain_ssl_errors()
{
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        std::array<char, 256> buf{};
        ERR_error_string_n(code, buf.data(), buf.size());
        if (!out.empty()) {
            out += "; ";
        }
        out += buf.data();
    }
    return out.empty() ? std::string{"unknown OpenSSL error"} : out;
}

SslError::SslError(std::string_view context)
    : std::runtime_error(std::string{context} + ": " + drain_ssl_errors())
{}

EvpPkeyPtr generate_ec_key()
{
    EvpPkeyCtxPtr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw SslError("EVP_PKEY_keygen_init");
    }
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        throw SslError("EVP_PKEY_CTX_set_ec_paramgen_curve_nid");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw SslError("EVP_PKEY_keygen");
    }
    return EvpPkeyPtr{raw};
}

std::string certificate_to_pem(X509* cert)
{
    BioPtr bio{BIO_new(BIO_s_mem())};
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw SslError("PEM_write_bio_X509");
    }
    return read_bio(bio.get());
}

std::string private_key_to_pem(EVP_PKEY* key)
{
    BioPtr bio{BIO_new(BIO_s_mem())};
    if (!bio ||
        PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1)
    {
        throw SslError("PEM_write_bio_PrivateKey");
    }
    return read_bio(bio.get());
}

X509Ptr certificate_from_pem(std::string_view pem)
{
    auto bio = memory_bio(pem);
    X509Ptr cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)};
    if (!cert) {
        throw SslError("PEM_read_bio_X509");
    }
    return cert;
}

EvpPkeyPtr private_key_from_pem(std::string_view pem)
{
    auto bio = memory_bio(pem);
    EvpPkeyPtr key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
    if (!key) {
        throw SslError("PEM_read_bio_PrivateKey");
    }
    return key;
}

void add_extension(X509* cert, X509* issuer, int nid, const std::string& value)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);

    X509ExtPtr ext{X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str())};
    if (!ext) {
        throw SslError("X509V3_EXT_conf_nid(" + value + ")");
    }
    if (X509_add_ext(cert, ext.get(), -1) != 1) {
        throw SslError("X509_add_ext");
    }
}

void set_random_serial(X509* cert)
{
    std::array<unsigned char, 20> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw SslError("RAND_bytes");
    }
    bytes[0] &= 0x7FU;  // 양수

    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn{
        BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), &BN_free};
    if (!bn || BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert)) == nullptr) {
        throw SslError("BN_to_ASN1_INTEGER");
    }
}

void set_validity(X509*                                 cert,
                  std::chrono::system_clock::time_point not_before,
                  std::chrono::system_clock::time_point not_after_tp)
{
    if (ASN1_TIME_set(X509_getm_notBefore(cert), std::chrono::system_clock::to_time_t(not_before)) == nullptr ||
        ASN1_TIME_set(X509_getm_notAfter(cert), std::chrono::system_clock::to_time_t(not_after_tp)) == nullptr)
    {
        throw SslError("ASN1_TIME_set");
    }
}

std::chrono::system_clock::time_point not_after(const X509* cert)
{
    std::tm tm_val{};
    if (ASN1_TIME_to_tm(X509_get0_notAfter(cert), &tm_val) != 1) {
        throw SslError("ASN1_TIME_to_tm");
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_val));
}

void set_common_name(X509* cert, std::string_view common_name)
{
    if (common_name.empty() || common_name.size() > 64) {
        return;
    }
    X509_NAME* name = X509_get_subject_name(cert);
    const std::string cn{common_name};
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(cn.c_str()),
                                   -1, -1, 0) != 1)
    {
        throw SslError("X509_NAME_add_entry_by_txt");
    }
}
