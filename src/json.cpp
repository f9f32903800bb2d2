#include "ppeguard/json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace ppeguard {
namespace {

const char* typeName(const Json& value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "boolean";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_object()) return "object";
    return "array";
}

std::runtime_error typeError(const char* expected, const Json& value) {
    return std::runtime_error(std::string("JSON type mismatch: expected ") + expected +
                              ", got " + typeName(value));
}

void appendEscaped(std::string& out, const std::string& text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                out += buffer;
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
}

void appendNumber(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    double integral = 0.0;
    if (std::modf(value, &integral) == 0.0 && std::fabs(value) < 1e15) {
        out += std::to_string(static_cast<long long>(value));
        return;
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    out += oss.str();
}

void appendUtf8(std::string& out, unsigned codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    Json parse() {
        Json value = parseValue();
        skipWs();
        if (pos_ != s_.size()) {
            fail("unexpected trailing characters");
        }
        return value;
    }

private:
    const std::string& s_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
    }

    void skipWs() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    bool consume(char expected) {
        skipWs();
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    Json parseValue() {
        skipWs();
        char c = peek();
        if (c == '"') return Json(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("invalid value");
    }

    Json parseObject() {
        consume('{');
        Json::object_t obj;
        if (consume('}')) {
            return Json(std::move(obj));
        }
        while (true) {
            skipWs();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parseString();
            if (!consume(':')) {
                fail("expected ':' after key");
            }
            obj[std::move(key)] = parseValue();
            if (consume('}')) {
                break;
            }
            if (!consume(',')) {
                fail("expected ',' in object");
            }
        }
        return Json(std::move(obj));
    }

    Json parseArray() {
        consume('[');
        Json::array_t arr;
        if (consume(']')) {
            return Json(std::move(arr));
        }
        while (true) {
            arr.push_back(parseValue());
            if (consume(']')) {
                break;
            }
            if (!consume(',')) {
                fail("expected ',' in array");
            }
        }
        return Json(std::move(arr));
    }

    unsigned parseHex4() {
        if (pos_ + 4 > s_.size()) {
            fail("truncated unicode escape");
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = s_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<unsigned>(h - 'A' + 10);
            else fail("invalid unicode escape");
        }
        return value;
    }

    std::string parseString() {
        if (!consume('"')) {
            fail("expected string");
        }
        std::string out;
        while (true) {
            if (pos_ >= s_.size()) {
                fail("unterminated string");
            }
            char c = s_[pos_++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) {
                fail("invalid escape sequence");
            }
            char esc = s_[pos_++];
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': appendUtf8(out, parseHex4()); break;
            default: fail("unsupported escape sequence");
            }
        }
        return out;
    }

    Json parseBool() {
        if (s_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Json(true);
        }
        if (s_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Json(false);
        }
        fail("invalid boolean literal");
    }

    Json parseNull() {
        if (s_.compare(pos_, 4, "null") != 0) {
            fail("invalid null literal");
        }
        pos_ += 4;
        return Json(nullptr);
    }

    Json parseNumber() {
        std::size_t start = pos_;
        auto digits = [this]() {
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
                ++pos_;
            }
        };
        if (peek() == '-') {
            ++pos_;
        }
        digits();
        if (peek() == '.') {
            ++pos_;
            digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            digits();
        }
        try {
            return Json(std::stod(s_.substr(start, pos_ - start)));
        } catch (const std::exception&) {
            fail("invalid number");
        }
    }
};

}  // namespace

const Json::object_t& Json::as_object() const {
    if (!is_object()) throw typeError("object", *this);
    return std::get<object_t>(value_);
}

Json::object_t& Json::as_object() {
    if (!is_object()) throw typeError("object", *this);
    return std::get<object_t>(value_);
}

const Json::array_t& Json::as_array() const {
    if (!is_array()) throw typeError("array", *this);
    return std::get<array_t>(value_);
}

Json::array_t& Json::as_array() {
    if (!is_array()) throw typeError("array", *this);
    return std::get<array_t>(value_);
}

const std::string& Json::as_string() const {
    if (!is_string()) throw typeError("string", *this);
    return std::get<std::string>(value_);
}

double Json::as_number() const {
    if (!is_number()) throw typeError("number", *this);
    return std::get<double>(value_);
}

bool Json::as_bool() const {
    if (!is_boolean()) throw typeError("boolean", *this);
    return std::get<bool>(value_);
}

const Json& Json::operator[](const std::string& key) const {
    const auto& obj = as_object();
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::out_of_range("key not found: " + key);
    }
    return it->second;
}

Json& Json::operator[](const std::string& key) {
    if (is_null()) {
        value_ = object_t{};
    }
    return as_object()[key];
}

bool Json::contains(const std::string& key) const {
    if (!is_object()) {
        return false;
    }
    const auto& obj = std::get<object_t>(value_);
    return obj.find(key) != obj.end();
}

std::string Json::get_string(const std::string& key, const std::string& fallback) const {
    if (!contains(key) || at(key).is_null()) {
        return fallback;
    }
    return at(key).as_string();
}

double Json::get_number(const std::string& key, double fallback) const {
    if (!contains(key) || at(key).is_null()) {
        return fallback;
    }
    return at(key).as_number();
}

int Json::get_int(const std::string& key, int fallback) const {
    return static_cast<int>(std::lround(get_number(key, fallback)));
}

bool Json::get_bool(const std::string& key, bool fallback) const {
    if (!contains(key) || at(key).is_null()) {
        return fallback;
    }
    return at(key).as_bool();
}

void Json::push_back(Json value) {
    if (is_null()) {
        value_ = array_t{};
    }
    as_array().push_back(std::move(value));
}

std::string Json::dump(int indent) const {
    std::string out;
    dump_impl(out, indent, 0);
    return out;
}

Json Json::parse(const std::string& text) {
    return Parser(text).parse();
}

Json Json::parse_file(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    try {
        return parse(content);
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error(path + ": " + ex.what());
    }
}

void Json::dump_impl(std::string& out, int indent, int depth) const {
    auto newline = [&](int level) {
        if (indent >= 0) {
            out.push_back('\n');
            out.append(static_cast<std::size_t>(level * indent), ' ');
        }
    };

    if (is_null()) {
        out += "null";
    } else if (is_boolean()) {
        out += std::get<bool>(value_) ? "true" : "false";
    } else if (is_number()) {
        appendNumber(out, std::get<double>(value_));
    } else if (is_string()) {
        appendEscaped(out, std::get<std::string>(value_));
    } else if (is_array()) {
        const auto& arr = std::get<array_t>(value_);
        out.push_back('[');
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            newline(depth + 1);
            arr[i].dump_impl(out, indent, depth + 1);
        }
        if (!arr.empty()) {
            newline(depth);
        }
        out.push_back(']');
    } else {
        const auto& obj = std::get<object_t>(value_);
        out.push_back('{');
        std::size_t count = 0;
        for (const auto& kv : obj) {
            if (count++ > 0) {
                out.push_back(',');
            }
            newline(depth + 1);
            appendEscaped(out, kv.first);
            out.push_back(':');
            if (indent >= 0) {
                out.push_back(' ');
            }
            kv.second.dump_impl(out, indent, depth + 1);
        }
        if (!obj.empty()) {
            newline(depth);
        }
        out.push_back('}');
    }
}

}  // namespace ppeguard
