//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Minimalistic JSON parser using only std library
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <iomanip>
#include "deskauth/JSONValue.h"
#include "logging/Logger.h"


namespace deskauth {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 64;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (c == '\\') {
                if (i >= s.size()) throw std::runtime_error("Invalid escape");
                char e = s[i++];
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
                        unsigned int code = parseHex4();
                        // Combine surrogate pairs; a lone surrogate becomes U+FFFD
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                                i += 2;
                                unsigned int low = parseHex4();
                                if (low >= 0xDC00 && low <= 0xDFFF) {
                                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                                } else {
                                    code = 0xFFFD;
                                }
                            } else {
                                code = 0xFFFD;
                            }
                        } else if (code >= 0xDC00 && code <= 0xDFFF) {
                            code = 0xFFFD;
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: throw std::runtime_error("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!closed) throw std::runtime_error("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) throw std::runtime_error("Invalid JSON value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                long long v = std::stoll(num);
                return JSONValue(static_cast<int64_t>(v));
            }
            double v = std::stod(num);
            return JSONValue(v);
        } catch (const std::out_of_range&) {
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        skipWs();
        if (match(']')) return JSONValue(arr);
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            skipWs();
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(arr);
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        skipWs();
        if (match('}')) return JSONValue(obj);
        while (true) {
            std::string key = parseString();
            skipWs();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            skipWs();
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(obj);
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') out = JSONValue(parseString());
        else if (c == '{') out = parseObject();
        else if (c == '[') out = parseArray();
        else if (s.compare(i, 4, "true") == 0) { i += 4; out = JSONValue(true); }
        else if (s.compare(i, 5, "false") == 0) { i += 5; out = JSONValue(false); }
        else if (s.compare(i, 4, "null") == 0) { i += 4; out = JSONValue(nullptr); }
        else out = parseNumber();
        --depth;
        return out;
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}
} // namespace

JSONValue parseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return v;
}

// Simple JSON serialization
std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    auto result = std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) return "null";
            std::ostringstream oss;
            oss << std::setprecision(17) << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::ostringstream oss;
            writeEscaped(oss, v);
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            std::ostringstream oss;
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << (v[i] ? serializeJSONValue(*v[i]) : std::string("null"));
            }
            oss << ']';
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::ostringstream oss;
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':' << (val ? serializeJSONValue(*val) : std::string("null"));
            }
            oss << '}';
            return oss.str();
        } else {
            return "null";
        }
    }, value.get());
    return result;
}

namespace {
const JSONValue* findField(const JSONValue& obj, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(obj.value)) {
        return nullptr;
    }
    const auto& o = std::get<JSONValue::Object>(obj.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}
} // namespace

std::optional<std::string> getStringField(const JSONValue& obj, const std::string& key) {
    const JSONValue* f = findField(obj, key);
    if (f == nullptr || !std::holds_alternative<std::string>(f->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(f->value);
}

std::optional<int64_t> getIntField(const JSONValue& obj, const std::string& key) {
    const JSONValue* f = findField(obj, key);
    if (f == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(f->value)) {
        return std::get<int64_t>(f->value);
    }
    if (std::holds_alternative<double>(f->value)) {
        return static_cast<int64_t>(std::get<double>(f->value));
    }
    // Some providers send expires_in as a numeric string
    if (std::holds_alternative<std::string>(f->value)) {
        const auto& s = std::get<std::string>(f->value);
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos && s.size() < 19) {
            return static_cast<int64_t>(std::stoll(s));
        }
    }
    return std::nullopt;
}

const JSONValue* getObjectField(const JSONValue& obj, const std::string& key) {
    const JSONValue* f = findField(obj, key);
    if (f == nullptr || !f->isObject()) {
        return nullptr;
    }
    return f;
}

} // namespace deskauth
