// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 RuntimeConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 섹션 누락 시 구조체 기본값을 적용한다. allowed_domains 누락은
//   빈 목록(모든 호스트 차단)이 되며 경고 로그를 남긴다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [스키마]
//   mode: limited | full
//   policy:
//     allowed_domains / denied_domains / allow_local_binding / allow_unix_sockets
//   mitm:
//     enabled / inspect / max_body_bytes / ca_cert_path / ca_key_path /
//     leaf_validity_hours
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"
#include "policy/domain_matcher.hpp"

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 bool 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: expected bool, got '{}', using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::uint64_t read_uint64(const YAML::Node& node, std::uint64_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint64_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: expected unsigned integer, got '{}', using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: PolicyConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] PolicyConfig parse_policy(const YAML::Node& node) {
    PolicyConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.allowed_domains     = read_string_sequence(node["allowed_domains"]);
    cfg.denied_domains      = read_string_sequence(node["denied_domains"]);
    cfg.allow_local_binding = read_bool(node["allow_local_binding"], cfg.allow_local_binding);
    cfg.allow_unix_sockets  = read_string_sequence(node["allow_unix_sockets"]);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: MitmConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] MitmConfig parse_mitm(const YAML::Node& node) {
    MitmConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.enabled        = read_bool(node["enabled"], cfg.enabled);
    cfg.inspect        = read_bool(node["inspect"], cfg.inspect);
    cfg.max_body_bytes = static_cast<std::size_t>(
        read_uint64(node["max_body_bytes"], cfg.max_body_bytes));
    cfg.ca_cert_path   = read_string(node["ca_cert_path"], cfg.ca_cert_path);
    cfg.ca_key_path    = read_string(node["ca_key_path"],  cfg.ca_key_path);

    const auto hours = read_uint64(node["leaf_validity_hours"], cfg.leaf_validity_hours);
    if (hours == 0 || hours > 24U * 365U) {
        spdlog::warn("policy_loader: mitm.leaf_validity_hours {} out of range, using {}",
                     hours, cfg.leaf_validity_hours);
    } else {
        cfg.leaf_validity_hours = static_cast<std::uint32_t>(hours);
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 도메인 패턴 검증. 첫 번째 잘못된 패턴을 오류로 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<void, std::string>
validate_patterns(std::string_view list_name, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (!is_valid_domain_pattern(p)) {
            return std::unexpected(fmt::format(
                "policy_loader: invalid pattern '{}' in policy.{} "
                "(only exact hosts and a leading '*.' wildcard are supported)",
                p, list_name));
        }
    }
    return {};
}

// 상대 경로 → base_dir 기준 절대 경로
[[nodiscard]] std::string resolve_relative(const std::string& raw,
                                           const std::filesystem::path& base_dir) {
    const std::filesystem::path p{raw};
    if (p.empty() || p.is_absolute()) {
        return raw;
    }
    return (base_dir / p).lexically_normal().string();
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<RuntimeConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 각 섹션 파싱 (try-catch per section)
    RuntimeConfig cfg{};

    const std::string mode_str = read_string(root["mode"], std::string{to_string(cfg.mode)});
    const auto mode = parse_network_mode(mode_str);
    if (!mode) {
        const std::string err = fmt::format(
            "policy_loader: unknown mode '{}' (expected 'limited' or 'full')", mode_str
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    cfg.mode = *mode;

    try {
        cfg.policy = parse_policy(root["policy"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: error parsing 'policy' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        cfg.mitm = parse_mitm(root["mitm"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: error parsing 'mitm' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 4. 패턴 검증. 잘못된 패턴 하나로 전체 로드 실패
    for (const auto& [name, list] : {std::pair{"allowed_domains", &cfg.policy.allowed_domains},
                                     std::pair{"denied_domains",  &cfg.policy.denied_domains}}) {
        if (auto valid = validate_patterns(name, *list); !valid) {
            spdlog::error("{}", valid.error());
            return std::unexpected(valid.error());
        }
    }

    // 5. CA 경로를 정책 파일 디렉터리 기준으로 변환
    const auto base_dir = canonical_path.parent_path();
    cfg.mitm.ca_cert_path = resolve_relative(cfg.mitm.ca_cert_path, base_dir);
    cfg.mitm.ca_key_path  = resolve_relative(cfg.mitm.ca_key_path,  base_dir);

    if (cfg.policy.allowed_domains.empty()) {
        spdlog::warn("policy_loader: policy.allowed_domains is empty, all hosts will be blocked");
    }

    spdlog::info(
        "policy_loader: policy loaded successfully: "
        "mode={}, allowed={}, denied={}, mitm={}",
        to_string(cfg.mode),
        cfg.policy.allowed_domains.size(),
        cfg.policy.denied_domains.size(),
        cfg.mitm.enabled
    );

    return cfg;
}
