#include "policy/domain_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr std::string_view kWildcardPrefix = "*.";

std::string to_lower(std::string_view s)
{
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

// 정규화된 pattern / host 를 비교한다.
bool matches_normalized(std::string_view pattern, std::string_view host)
{
    if (pattern.empty() || host.empty()) {
        return false;
    }
    if (!pattern.starts_with(kWildcardPrefix)) {
        return pattern == host;
    }

    const std::string_view apex = pattern.substr(kWildcardPrefix.size());
    if (apex.empty()) {
        return false;
    }
    if (host == apex) {
        return true;
    }
    // "x.apex": apex 앞 문자가 반드시 '.' 이어야 한다 ("evilapex" 불일치)
    return host.size() > apex.size() + 1 &&
           host.ends_with(apex) &&
           host[host.size() - apex.size() - 1] == '.';
}

}  // namespace

std::string normalize_host(std::string_view host)
{
    std::string_view h = trim(host);

    if (h.starts_with('[')) {
        // [v6] 또는 [v6]:port
        const auto close = h.find(']');
        if (close != std::string_view::npos) {
            h = h.substr(1, close - 1);
        }
    } else if (std::count(h.begin(), h.end(), ':') == 1) {
        // host:port (콜론이 2개 이상이면 괄호 없는 IPv6 로 간주)
        h = h.substr(0, h.find(':'));
    }

    if (h.ends_with('.')) {
        h.remove_suffix(1);
    }
    return to_lower(h);
}

bool is_valid_domain_pattern(std::string_view pattern)
{
    const std::string_view p = trim(pattern);
    if (p.empty()) {
        return false;
    }
    const auto star = p.find('*');
    if (star == std::string_view::npos) {
        return true;
    }
    // '*' 는 선두 "*." 에서 한 번만 허용
    return star == 0 &&
           p.starts_with(kWildcardPrefix) &&
           p.size() > kWildcardPrefix.size() &&
           p.find('*', 1) == std::string_view::npos;
}

bool matches(std::string_view pattern, std::string_view hostname)
{
    const std::string p = normalize_host(pattern);
    const std::string h = normalize_host(hostname);
    return matches_normalized(p, h);
}

// ---------------------------------------------------------------------------
// DomainPatternSet
// ---------------------------------------------------------------------------
DomainPatternSet::DomainPatternSet(const std::vector<std::string>& patterns)
{
    patterns_.reserve(patterns.size());
    for (const auto& raw : patterns) {
        std::string p = normalize_host(raw);
        if (p.empty()) {
            continue;
        }
        if (std::find(patterns_.begin(), patterns_.end(), p) == patterns_.end()) {
            patterns_.push_back(std::move(p));
        }
    }
}

bool DomainPatternSet::matches_any(std::string_view normalized_host) const
{
    return std::any_of(patterns_.begin(), patterns_.end(),
                       [&](const std::string& p) { return matches_normalized(p, normalized_host); });
}

bool DomainPatternSet::contains_exact(std::string_view normalized_host) const
{
    return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::string& p) {
        return !p.starts_with(kWildcardPrefix) && p == normalized_host;
    });
}
