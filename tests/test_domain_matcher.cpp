// ---------------------------------------------------------------------------
// test_domain_matcher.cpp
//
// normalize_host / is_valid_domain_pattern / matches / DomainPatternSet 단위 테스트.
//
// [테스트 범위]
// - 정규화: 대소문자, 끝의 '.', ":port", "[v6]:port", 공백
// - "*.apex" 는 apex 자신과 모든 깊이의 하위 도메인에 일치
// - 접미사 함정: "evilopenai.com" 은 "*.openai.com" 과 불일치
// - 잘못된 패턴: 중간/끝 '*', 빈 문자열, "*." 단독
// ---------------------------------------------------------------------------

#include "policy/domain_matcher.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// normalize_host
// ---------------------------------------------------------------------------
TEST(NormalizeHostTest, LowercasesAndStripsTrailingDot)
{
    EXPECT_EQ(normalize_host("API.OpenAI.com."), "api.openai.com");
}

TEST(NormalizeHostTest, StripsPort)
{
    EXPECT_EQ(normalize_host("example.com:8080"), "example.com");
}

TEST(NormalizeHostTest, StripsBracketsAndPortFromIpv6)
{
    EXPECT_EQ(normalize_host("[::1]:443"), "::1");
    EXPECT_EQ(normalize_host("[FE80::1]"), "fe80::1");
}

TEST(NormalizeHostTest, BareIpv6IsKeptWhole)
{
    EXPECT_EQ(normalize_host("2001:db8::1"), "2001:db8::1");
}

TEST(NormalizeHostTest, TrimsWhitespace)
{
    EXPECT_EQ(normalize_host("  example.com\t"), "example.com");
}

// ---------------------------------------------------------------------------
// matches
// ---------------------------------------------------------------------------
TEST(DomainMatchTest, ExactMatchIsCaseInsensitive)
{
    EXPECT_TRUE(matches("example.com", "EXAMPLE.com"));
    EXPECT_FALSE(matches("example.com", "www.example.com"));
}

TEST(DomainMatchTest, WildcardMatchesApexItself)
{
    EXPECT_TRUE(matches("*.openai.com", "openai.com"));
}

TEST(DomainMatchTest, WildcardMatchesSubdomainsAtAnyDepth)
{
    EXPECT_TRUE(matches("*.openai.com", "api.openai.com"));
    EXPECT_TRUE(matches("*.openai.com", "a.b.c.openai.com"));
}

TEST(DomainMatchTest, WildcardDoesNotMatchSuffixWithoutDot)
{
    EXPECT_FALSE(matches("*.openai.com", "evilopenai.com"));
    EXPECT_FALSE(matches("*.openai.com", "openai.com.evil.net"));
}

TEST(DomainMatchTest, TrailingDotAndPortIgnored)
{
    EXPECT_TRUE(matches("*.openai.com", "api.openai.com.:443"));
}

TEST(DomainMatchTest, EmptyHostNeverMatches)
{
    EXPECT_FALSE(matches("*.openai.com", ""));
    EXPECT_FALSE(matches("", ""));
}

// ---------------------------------------------------------------------------
// is_valid_domain_pattern
// ---------------------------------------------------------------------------
TEST(DomainPatternValidationTest, AcceptsExactAndLeadingWildcard)
{
    EXPECT_TRUE(is_valid_domain_pattern("example.com"));
    EXPECT_TRUE(is_valid_domain_pattern("*.example.com"));
    EXPECT_TRUE(is_valid_domain_pattern("127.0.0.1"));
}

TEST(DomainPatternValidationTest, RejectsMisplacedWildcards)
{
    EXPECT_FALSE(is_valid_domain_pattern("api.*.com"));
    EXPECT_FALSE(is_valid_domain_pattern("example.*"));
    EXPECT_FALSE(is_valid_domain_pattern("*example.com"));
    EXPECT_FALSE(is_valid_domain_pattern("*.*.example.com"));
    EXPECT_FALSE(is_valid_domain_pattern("*."));
    EXPECT_FALSE(is_valid_domain_pattern("*"));
}

TEST(DomainPatternValidationTest, RejectsEmpty)
{
    EXPECT_FALSE(is_valid_domain_pattern(""));
    EXPECT_FALSE(is_valid_domain_pattern("   "));
}

// ---------------------------------------------------------------------------
// DomainPatternSet
// ---------------------------------------------------------------------------
TEST(DomainPatternSetTest, NormalizesAndDeduplicates)
{
    const DomainPatternSet set{std::vector<std::string>{"Example.COM", "example.com.", "*.B.org"}};

    ASSERT_EQ(set.patterns().size(), 2U);
    EXPECT_EQ(set.patterns()[0], "example.com");
    EXPECT_EQ(set.patterns()[1], "*.b.org");
}

TEST(DomainPatternSetTest, MatchesAnyPattern)
{
    const DomainPatternSet set{std::vector<std::string>{"example.com", "*.b.org"}};

    EXPECT_TRUE(set.matches_any("example.com"));
    EXPECT_TRUE(set.matches_any("x.y.b.org"));
    EXPECT_FALSE(set.matches_any("c.org"));
}

TEST(DomainPatternSetTest, ContainsExactIgnoresWildcards)
{
    const DomainPatternSet set{std::vector<std::string>{"127.0.0.1", "*.internal"}};

    EXPECT_TRUE(set.contains_exact("127.0.0.1"));
    EXPECT_FALSE(set.contains_exact("db.internal"));
    EXPECT_FALSE(set.contains_exact("internal"));
}

TEST(DomainPatternSetTest, EmptySet)
{
    const DomainPatternSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_FALSE(set.matches_any("example.com"));
}
