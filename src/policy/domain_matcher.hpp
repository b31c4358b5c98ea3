#pragma once

// ---------------------------------------------------------------------------
// domain_matcher.hpp
//
// 호스트명과 도메인 패턴의 일치 여부를 판정하는 순수 함수 모음.
//
// [패턴 규칙]
// - "*.apex" : apex 자신과 모든 깊이의 하위 도메인에 일치
//              ("*.openai.com" → "openai.com", "api.openai.com", "a.b.openai.com")
// - 그 외     : 대소문자 무시 정확 일치만
// - 정규식/중간 와일드카드 없음. "*" 가 다른 위치에 있으면 유효하지 않은 패턴.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// normalize_host
//   공백 제거 → "[v6]" 괄호 제거 → ":port" 제거 → 끝의 '.' 하나 제거 → 소문자.
[[nodiscard]] std::string normalize_host(std::string_view host);

// is_valid_domain_pattern
//   비어 있지 않고, '*' 는 선두 "*." 형태로만 등장해야 한다.
[[nodiscard]] bool is_valid_domain_pattern(std::string_view pattern);

// matches
//   pattern 과 hostname 모두 내부에서 정규화 후 비교한다.
[[nodiscard]] bool matches(std::string_view pattern, std::string_view hostname);

// ---------------------------------------------------------------------------
// DomainPatternSet
//   정규화된 패턴 목록. PolicySnapshot 생성 시 한 번 컴파일된다.
// ---------------------------------------------------------------------------
class DomainPatternSet {
public:
    DomainPatternSet() = default;
    explicit DomainPatternSet(const std::vector<std::string>& patterns);

    // matches_any: host 는 normalize_host 를 거친 값이어야 한다.
    [[nodiscard]] bool matches_any(std::string_view normalized_host) const;

    // contains_exact: 와일드카드가 아닌 항목 중 host 와 정확히 같은 것이 있는가
    [[nodiscard]] bool contains_exact(std::string_view normalized_host) const;

    [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }

private:
    std::vector<std::string> patterns_{};
};
