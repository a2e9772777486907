#include "stmeta/json.hpp"

#include "stmeta/error.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>
#include <unordered_map>

namespace stmeta {

// ------------------------------
// Accessors and builders
// ------------------------------

const Json::Object& Json::as_object() const {
    if (!is_object()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not an object");
    return std::get<Object>(v);
}

Json::Object& Json::as_object() {
    if (!is_object()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not an object");
    return std::get<Object>(v);
}

const Json::Array& Json::as_array() const {
    if (!is_array()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not an array");
    return std::get<Array>(v);
}

Json::Array& Json::as_array() {
    if (!is_array()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not an array");
    return std::get<Array>(v);
}

const std::string& Json::as_string() const {
    if (!is_string()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not a string");
    return std::get<std::string>(v);
}

bool Json::as_bool() const {
    if (!is_bool()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not a boolean");
    return std::get<bool>(v);
}

const JsonNumber& Json::as_number() const {
    if (!is_number()) throw StmetaError(ErrorKind::InvalidJson, "JSON value is not a number");
    return std::get<JsonNumber>(v);
}

const Json* Json::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    for (const auto& kv : std::get<Object>(v)) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

Json* Json::find(std::string_view key) {
    if (!is_object()) return nullptr;
    for (auto& kv : std::get<Object>(v)) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

void Json::set(std::string key, Json value) {
    Object& obj = as_object();
    for (auto& kv : obj) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return;
        }
    }
    obj.emplace_back(std::move(key), std::move(value));
}

bool Json::erase(std::string_view key) {
    Object& obj = as_object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it->first == key) {
            obj.erase(it);
            return true;
        }
    }
    return false;
}

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        std::uint8_t c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t n = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; min_cp = 0x10000; }
        else return false;

        if (size - i - 1 < n) return false;
        for (std::size_t k = 1; k <= n; ++k) {
            std::uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp) return false;                  // overlong
        if (cp >= 0xD800 && cp <= 0xDFFF) return false; // surrogate
        if (cp > 0x10FFFF) return false;
        i += n + 1;
    }
    return true;
}

bool is_valid_utf8(std::string_view s) {
    return is_valid_utf8(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

Json Json::null() { return Json{nullptr}; }
Json Json::boolean(bool b) { return Json{b}; }
Json Json::string(std::string s) { return Json{std::move(s)}; }

Json Json::number(double d) {
    JsonNumber n;
    n.value = d;
    n.is_int = false;
    // Non-finite values keep an empty raw text and are rejected by dump_json().
    if (std::isfinite(d)) n.raw = format_double(d);
    return Json{n};
}

Json Json::integer(std::int64_t i) {
    JsonNumber n;
    n.is_int = true;
    n.value = static_cast<double>(i);
    n.raw = std::to_string(i);
    return Json{n};
}

Json Json::unsigned_integer(std::uint64_t u) {
    JsonNumber n;
    n.is_int = true;
    n.value = static_cast<double>(u);
    n.raw = std::to_string(u);
    return Json{n};
}

Json Json::array(Array a) { return Json{std::move(a)}; }
Json Json::object(Object o) { return Json{std::move(o)}; }

std::string format_double(double d) {
    if (!std::isfinite(d)) {
        throw StmetaError(ErrorKind::SerializationError, "non-finite number cannot be represented in JSON");
    }
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(precision) << d;
        std::string s = oss.str();
        std::istringstream iss(s);
        iss.imbue(std::locale::classic());
        double back = 0.0;
        iss >> back;
        if (back == d || precision == 17) return s;
    }
    return {};
}

// ------------------------------
// Parser
// ------------------------------

namespace {

constexpr std::size_t kMaxDepth = 512;

class JsonParser {
public:
    explicit JsonParser(std::string_view s) : s_(s) {}

    Json parse() {
        skip_ws();
        Json out = parse_value(0);
        skip_ws();
        if (pos_ != s_.size()) {
            fail("trailing data in JSON");
        }
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& what) const {
        throw StmetaError(ErrorKind::InvalidJson, what + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) {
            fail("unexpected end of JSON");
        }
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    std::string parse_string() {
        // opening quote already consumed
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in JSON string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char e = get();
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned u = parse_hex4();
                    if (u >= 0xD800 && u <= 0xDBFF) {
                        if (get() != '\\' || get() != 'u') {
                            fail("invalid surrogate pair");
                        }
                        unsigned u2 = parse_hex4();
                        if (u2 < 0xDC00 || u2 > 0xDFFF) {
                            fail("invalid surrogate pair");
                        }
                        append_utf8(out, 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00)));
                    } else if (u >= 0xDC00 && u <= 0xDFFF) {
                        fail("unpaired low surrogate");
                    } else {
                        append_utf8(out, u);
                    }
                    break;
                }
                default:
                    fail("invalid escape in JSON string");
            }
        }
        return out;
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    Json parse_number() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;

        if (peek() == '0') {
            ++pos_;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) ++pos_;
        } else {
            fail("invalid number in JSON");
        }

        bool has_frac = false;
        bool has_exp = false;
        if (peek() == '.') {
            has_frac = true;
            ++pos_;
            if (!is_digit(peek())) fail("invalid number in JSON");
            while (is_digit(peek())) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            has_exp = true;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!is_digit(peek())) fail("invalid number in JSON");
            while (is_digit(peek())) ++pos_;
        }

        JsonNumber n;
        n.raw = std::string(s_.substr(start, pos_ - start));
        // Out of range values saturate; the raw text is what gets written back.
        n.value = std::strtod(n.raw.c_str(), nullptr);
        n.is_int = !(has_frac || has_exp);
        return Json{n};
    }

    Json parse_array(std::size_t depth) {
        // '[' consumed
        Json::Array arr;
        skip_ws();
        if (peek() == ']') {
            get();
            return Json{arr};
        }
        while (true) {
            skip_ws();
            arr.push_back(parse_value(depth + 1));
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') fail("expected ',' in array");
        }
        return Json{arr};
    }

    Json parse_object(std::size_t depth) {
        // '{' consumed
        Json out = Json::object();
        skip_ws();
        if (peek() == '}') {
            get();
            return out;
        }
        Json::Object& members = out.as_object();
        std::unordered_map<std::string, std::size_t> index;
        while (true) {
            skip_ws();
            if (get() != '"') fail("expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') fail("expected ':' in object");
            skip_ws();
            Json value = parse_value(depth + 1);
            // Duplicate keys: the last value wins, at the first key's position.
            auto it = index.find(key);
            if (it != index.end()) {
                members[it->second].second = std::move(value);
            } else {
                index.emplace(key, members.size());
                members.emplace_back(std::move(key), std::move(value));
            }
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') fail("expected ',' in object");
        }
        return out;
    }

    Json parse_value(std::size_t depth) {
        if (depth > kMaxDepth) fail("JSON nesting too deep");
        skip_ws();
        char c = peek();
        if (c == '"') { get(); return Json{parse_string()}; }
        if (c == '{') { get(); return parse_object(depth); }
        if (c == '[') { get(); return parse_array(depth); }
        if (c == 't') { expect("true"); return Json{true}; }
        if (c == 'f') { expect("false"); return Json{false}; }
        if (c == 'n') { expect("null"); return Json{nullptr}; }
        return parse_number();
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            fail(std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

// ------------------------------
// Serializer
// ------------------------------

void json_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

void json_serialize(std::ostream& os, const Json& j) {
    if (j.is_null()) {
        os << "null";
    } else if (j.is_bool()) {
        os << (std::get<bool>(j.v) ? "true" : "false");
    } else if (j.is_number()) {
        const auto& n = std::get<JsonNumber>(j.v);
        if (n.raw.empty()) {
            throw StmetaError(ErrorKind::SerializationError, "non-finite number cannot be represented in JSON");
        }
        os << n.raw;
    } else if (j.is_string()) {
        json_escape_string(os, std::get<std::string>(j.v));
    } else if (j.is_array()) {
        const auto& arr = std::get<Json::Array>(j.v);
        os << '[';
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i) os << ',';
            json_serialize(os, arr[i]);
        }
        os << ']';
    } else {
        os << '{';
        bool first = true;
        for (const auto& kv : std::get<Json::Object>(j.v)) {
            if (!first) os << ',';
            first = false;
            json_escape_string(os, kv.first);
            os << ':';
            json_serialize(os, kv.second);
        }
        os << '}';
    }
}

} // namespace

Json parse_json(std::string_view text) {
    if (!is_valid_utf8(text)) {
        throw StmetaError(ErrorKind::InvalidJson, "JSON text is not valid UTF-8");
    }
    return JsonParser(text).parse();
}

std::string dump_json(const Json& j) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    json_serialize(oss, j);
    return oss.str();
}

bool json_equal(const Json& a, const Json& b) {
    if (a.v.index() != b.v.index()) return false;
    if (a.is_null()) return true;
    if (a.is_bool()) return a.as_bool() == b.as_bool();
    if (a.is_string()) return a.as_string() == b.as_string();
    if (a.is_number()) {
        const auto& x = a.as_number();
        const auto& y = b.as_number();
        if (x.is_int && y.is_int) return x.raw == y.raw;
        return x.value == y.value;
    }
    if (a.is_array()) {
        const auto& x = a.as_array();
        const auto& y = b.as_array();
        if (x.size() != y.size()) return false;
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (!json_equal(x[i], y[i])) return false;
        }
        return true;
    }
    const auto& x = a.as_object();
    const auto& y = b.as_object();
    if (x.size() != y.size()) return false;
    for (const auto& kv : x) {
        const Json* other = b.find(kv.first);
        if (!other || !json_equal(kv.second, *other)) return false;
    }
    return true;
}

} // namespace stmeta
