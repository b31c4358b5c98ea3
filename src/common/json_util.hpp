#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 외부 JSON 라이브러리 없이 로그/관리 API 응답을 구성하기 위한 최소 헬퍼.
//
// [범위]
// - 직렬화: 문자열 이스케이프, 문자열 배열 직렬화
// - 역직렬화: 평면 객체에서 "key":"value" 문자열 필드 하나 추출
//   중첩 객체/배열 파싱은 지원하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// json_escape
//   JSON 문자열 리터럴 내부에 넣을 수 있도록 이스케이프한다 (따옴표 미포함).
[[nodiscard]] std::string json_escape(std::string_view str);

// json_string_array
//   ["a","b"] 형태로 직렬화한다.
[[nodiscard]] std::string json_string_array(const std::vector<std::string>& items);

// json_is_object
//   body 가 문법적으로 올바른 평면 JSON 객체인가.
[[nodiscard]] bool json_is_object(std::string_view body);

// json_string_field
//   body 가 JSON 객체이고 key 가 문자열 값을 가지면 그 값을 반환한다.
//   body 가 객체가 아니거나 key 가 없거나 값이 문자열이 아니면 std::nullopt.
[[nodiscard]] std::optional<std::string> json_string_field(std::string_view body,
                                                           std::string_view key);

// format_iso8601
//   UTC 밀리초 정밀도 ISO8601 문자열 ("2024-01-01T00:00:00.000Z").
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
