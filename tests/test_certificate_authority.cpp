// ---------------------------------------------------------------------------
// test_certificate_authority.cpp
//
// CertificateAuthority 영속화 테스트.
//
// [테스트 범위]
// - 파일이 없으면 생성 (키 0600, 인증서 0644)
// - 다시 로드하면 같은 인증서
// - 한쪽 파일만 있으면 오류 (덮어쓰지 않음)
// - 키와 인증서가 짝이 맞지 않으면 오류
// - 생성된 CA 의 basicConstraints CA:TRUE
// ---------------------------------------------------------------------------

#include "mitm/certificate_authority.hpp"

#include <gtest/gtest.h>

#include <openssl/x509v3.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

class CaFileTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               (std::string{"netgate_ca_"} +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static std::string slurp(const fs::path& p)
    {
        std::ifstream in{p};
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

}  // namespace

TEST_F(CaFileTest, CreatesPairWithRestrictedKeyPermissions)
{
    const auto cert_path = dir_ / "mitm" / "ca.pem";
    const auto key_path  = dir_ / "mitm" / "ca.key";

    const auto ca = CertificateAuthority::load_or_create(cert_path, key_path);
    ASSERT_TRUE(ca.has_value()) << ca.error();

    ASSERT_TRUE(fs::exists(cert_path));
    ASSERT_TRUE(fs::exists(key_path));

    const auto key_perms  = fs::status(key_path).permissions();
    const auto cert_perms = fs::status(cert_path).permissions();
    EXPECT_EQ(key_perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(cert_perms & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write |
              fs::perms::group_read | fs::perms::others_read);

    EXPECT_NE(slurp(cert_path).find("BEGIN CERTIFICATE"), std::string::npos);
}

TEST_F(CaFileTest, ReloadsSameCertificate)
{
    const auto cert_path = dir_ / "ca.pem";
    const auto key_path  = dir_ / "ca.key";

    const auto first = CertificateAuthority::load_or_create(cert_path, key_path);
    ASSERT_TRUE(first.has_value()) << first.error();
    const auto second = CertificateAuthority::load_or_create(cert_path, key_path);
    ASSERT_TRUE(second.has_value()) << second.error();

    EXPECT_EQ((*first)->certificate_pem(), (*second)->certificate_pem());
    EXPECT_EQ(X509_check_private_key((*second)->certificate(), (*second)->key()), 1);
}

TEST_F(CaFileTest, SingleFileIsAnErrorAndNotOverwritten)
{
    const auto cert_path = dir_ / "ca.pem";
    const auto key_path  = dir_ / "ca.key";
    {
        std::ofstream out{cert_path};
        out << "operator supplied";
    }

    const auto ca = CertificateAuthority::load_or_create(cert_path, key_path);
    ASSERT_FALSE(ca.has_value());
    EXPECT_NE(ca.error().find("incomplete"), std::string::npos);
    EXPECT_FALSE(fs::exists(key_path));
    EXPECT_EQ(slurp(cert_path), "operator supplied");
}

TEST_F(CaFileTest, MismatchedKeyIsRejected)
{
    const auto a_cert = dir_ / "a" / "ca.pem";
    const auto a_key  = dir_ / "a" / "ca.key";
    const auto b_cert = dir_ / "b" / "ca.pem";
    const auto b_key  = dir_ / "b" / "ca.key";

    ASSERT_TRUE(CertificateAuthority::load_or_create(a_cert, a_key).has_value());
    ASSERT_TRUE(CertificateAuthority::load_or_create(b_cert, b_key).has_value());

    const auto mixed = CertificateAuthority::load_or_create(a_cert, b_key);
    ASSERT_FALSE(mixed.has_value());
    EXPECT_NE(mixed.error().find("does not match"), std::string::npos);
}

TEST_F(CaFileTest, GarbagePemIsRejected)
{
    const auto cert_path = dir_ / "ca.pem";
    const auto key_path  = dir_ / "ca.key";
    {
        std::ofstream c{cert_path};
        c << "not a certificate";
        std::ofstream k{key_path};
        k << "not a key";
    }

    EXPECT_FALSE(CertificateAuthority::load_or_create(cert_path, key_path).has_value());
}

TEST(CertificateAuthorityTest, GeneratedCaIsSelfSignedCa)
{
    const auto ca = CertificateAuthority::generate();
    ASSERT_TRUE(ca.has_value()) << ca.error();

    X509* cert = (*ca)->certificate();
    EXPECT_EQ(X509_check_ca(cert), 1);
    EXPECT_EQ(X509_verify(cert, (*ca)->key()), 1);
    EXPECT_EQ(X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)), 0);
}

TEST_F(CaFileTest, WriteFileAtomicReplacesContent)
{
    const auto path = dir_ / "data.txt";

    ASSERT_TRUE(write_file_atomic(path, "one", fs::perms::owner_read | fs::perms::owner_write).has_value());
    ASSERT_TRUE(write_file_atomic(path, "two", fs::perms::owner_read | fs::perms::owner_write).has_value());

    EXPECT_EQ(slurp(path), "two");
    // 임시 파일이 남지 않는다
    int count = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator{dir_}) {
        ++count;
    }
    EXPECT_EQ(count, 1);
}
