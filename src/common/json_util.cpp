#include "common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace {

void skip_ws(std::string_view s, std::size_t& pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])) != 0) {
        ++pos;
    }
}

// ---------------------------------------------------------------------------
// parse_string
//   s[pos] == '"' 에서 시작하는 JSON 문자열을 읽는다.
//   \uXXXX 는 ASCII 범위만 디코딩하고 나머지는 '?' 로 대체한다.
// ---------------------------------------------------------------------------
std::optional<std::string> parse_string(std::string_view s, std::size_t& pos)
{
    if (pos >= s.size() || s[pos] != '"') {
        return std::nullopt;
    }
    ++pos;

    std::string out;
    while (pos < s.size()) {
        const char c = s[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= s.size()) {
            return std::nullopt;
        }
        const char esc = s[pos++];
        switch (esc) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                if (pos + 4 > s.size()) {
                    return std::nullopt;
                }
                unsigned int code = 0;
                for (std::size_t i = 0; i < 4; ++i) {
                    const char h = s[pos + i];
                    code <<= 4U;
                    if (h >= '0' && h <= '9')      { code |= static_cast<unsigned int>(h - '0'); }
                    else if (h >= 'a' && h <= 'f') { code |= static_cast<unsigned int>(h - 'a' + 10); }
                    else if (h >= 'A' && h <= 'F') { code |= static_cast<unsigned int>(h - 'A' + 10); }
                    else { return std::nullopt; }
                }
                pos += 4;
                out += (code < 0x80) ? static_cast<char>(code) : '?';
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;  // 닫는 따옴표 없음
}

// ---------------------------------------------------------------------------
// skip_value
//   문자열이 아닌 값(숫자/bool/null/중첩 객체·배열)을 건너뛴다.
//   중첩 내부의 문자열은 괄호 깊이 계산에서 제외한다.
// ---------------------------------------------------------------------------
bool skip_value(std::string_view s, std::size_t& pos)
{
    int depth = 0;
    while (pos < s.size()) {
        const char c = s[pos];
        if (c == '"') {
            if (!parse_string(s, pos)) {
                return false;
            }
            if (depth == 0) {
                return true;
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (depth == 0) {
                return true;  // 바깥 객체의 닫는 괄호는 호출자가 처리
            }
            --depth;
        } else if (c == ',' && depth == 0) {
            return true;
        }
        ++pos;
    }
    return depth == 0;
}

}  // namespace

std::string json_escape(std::string_view str)
{
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

std::string json_string_array(const std::vector<std::string>& items)
{
    std::string out{"["};
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '"';
        out += json_escape(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}

namespace {

// ---------------------------------------------------------------------------
// scan_object
//   평면 JSON 객체를 끝까지 검증하면서 key 의 문자열 값을 found 에 담는다.
//   구조가 올바르면 true.
// ---------------------------------------------------------------------------
bool scan_object(std::string_view body, std::string_view key, std::optional<std::string>& found)
{
    std::size_t pos = 0;
    skip_ws(body, pos);
    if (pos >= body.size() || body[pos] != '{') {
        return false;
    }
    ++pos;

    for (;;) {
        skip_ws(body, pos);
        if (pos < body.size() && body[pos] == '}') {
            ++pos;
            break;
        }

        auto name = parse_string(body, pos);
        if (!name) {
            return false;
        }
        skip_ws(body, pos);
        if (pos >= body.size() || body[pos] != ':') {
            return false;
        }
        ++pos;
        skip_ws(body, pos);

        if (pos < body.size() && body[pos] == '"') {
            auto value = parse_string(body, pos);
            if (!value) {
                return false;
            }
            if (*name == key) {
                found = std::move(*value);
            }
        } else {
            if (!skip_value(body, pos)) {
                return false;
            }
        }

        skip_ws(body, pos);
        if (pos < body.size() && body[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < body.size() && body[pos] == '}') {
            ++pos;
            break;
        }
        return false;
    }

    // 닫는 괄호 뒤에는 공백만 허용
    skip_ws(body, pos);
    return pos == body.size();
}

}  // namespace

bool json_is_object(std::string_view body)
{
    std::optional<std::string> ignored;
    return scan_object(body, {}, ignored);
}

std::optional<std::string> json_string_field(std::string_view body, std::string_view key)
{
    std::optional<std::string> found;
    if (!scan_object(body, key, found)) {
        return std::nullopt;
    }
    return found;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp)
{
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis      = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) - seconds;

    const std::time_t time_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_val, &tm_val);

    char buf[32]{};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);

    char out[48]{};
    std::snprintf(out, sizeof(out), "%.*s.%03dZ",
                  static_cast<int>(n), buf, static_cast<int>(millis.count()));
    return out;
}
