//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "mcphost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcphost {

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

bool operator==(const JSONValue& lhs, const JSONValue& rhs) {
    if (lhs.value.index() != rhs.value.index()) {
        return false;
    }
    auto sameChild = [](const std::shared_ptr<JSONValue>& a, const std::shared_ptr<JSONValue>& b) {
        if (!a || !b) {
            return !a && !b;
        }
        return *a == *b;
    };
    if (const auto* la = std::get_if<JSONValue::Array>(&lhs.value)) {
        const auto& ra = std::get<JSONValue::Array>(rhs.value);
        if (la->size() != ra.size()) {
            return false;
        }
        for (std::size_t i = 0; i < la->size(); ++i) {
            if (!sameChild((*la)[i], ra[i])) {
                return false;
            }
        }
        return true;
    }
    if (const auto* lo = std::get_if<JSONValue::Object>(&lhs.value)) {
        const auto& ro = std::get<JSONValue::Object>(rhs.value);
        if (lo->size() != ro.size()) {
            return false;
        }
        for (const auto& [key, child] : *lo) {
            auto it = ro.find(key);
            if (it == ro.end() || !sameChild(child, it->second)) {
                return false;
            }
        }
        return true;
    }
    return lhs.value == rhs.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr int MaxNestingDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(fmt::format("JSON parse error at offset {}: {}", i, what));
    }

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
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
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
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired high surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        auto digits = [this]() {
            std::size_t begin = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            return i - begin;
        };
        if (i < s.size() && s[i] == '-') ++i;
        if (digits() == 0) fail("invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (digits() == 0) fail("digits expected after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (digits() == 0) fail("digits expected in exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64_t degrade to double precision
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                JSONValue val = parseValue();
                arr.push_back(std::make_shared<JSONValue>(std::move(val)));
                if (match(']')) break;
                if (!match(',')) fail("expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > MaxNestingDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("expected ':' after key");
                JSONValue val = parseValue();
                obj[key] = std::make_shared<JSONValue>(std::move(val));
                if (match('}')) break;
                if (!match(',')) fail("expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail(fmt::format("unexpected character '{}'", c));
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                throw std::runtime_error("JSON cannot represent a non-finite number");
            }
            std::string num = fmt::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (!v[k]) throw std::runtime_error("null array element");
                appendValue(out, *v[k]);
            }
            out.push_back(']');
        } else {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, child] : v) {
                if (!child) throw std::runtime_error(fmt::format("null value for key '{}'", key));
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                appendValue(out, *child);
            }
            out.push_back('}');
        }
    }, value.get());
}

void appendId(std::string& out, const JSONRPCId& id) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
}

// Reads the "id" member; only string, integer and null are legal ids.
std::optional<JSONRPCId> idFromValue(const JSONValue& v) {
    if (const auto* str = std::get_if<std::string>(&v.value)) return JSONRPCId{*str};
    if (const auto* num = std::get_if<int64_t>(&v.value)) return JSONRPCId{*num};
    if (v.IsNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

std::optional<JSONValue> optionalMember(const JSONValue& root, const char* key) {
    const JSONValue* m = GetMember(root, key);
    if (m == nullptr) return std::nullopt;
    return *m;
}

void requireEnvelope(const JSONValue& root) {
    if (!root.IsObject()) {
        throw std::runtime_error("JSON-RPC message must be an object");
    }
    const JSONValue* version = GetMember(root, "jsonrpc");
    const auto* str = version ? std::get_if<std::string>(&version->value) : nullptr;
    if (str == nullptr || *str != "2.0") {
        throw std::runtime_error("missing or unsupported jsonrpc version");
    }
}

std::string requireMethod(const JSONValue& root) {
    const JSONValue* method = GetMember(root, "method");
    const auto* str = method ? std::get_if<std::string>(&method->value) : nullptr;
    if (str == nullptr || str->empty()) {
        throw std::runtime_error("method must be a non-empty string");
    }
    return *str;
}

JSONRPCRequest requestFromValue(const JSONValue& root) {
    requireEnvelope(root);
    JSONRPCRequest request;
    request.method = requireMethod(root);
    const JSONValue* idVal = GetMember(root, "id");
    auto id = idVal ? idFromValue(*idVal) : std::nullopt;
    if (!id.has_value() || std::holds_alternative<std::nullptr_t>(*id)) {
        throw std::runtime_error("request id must be a string or an integer");
    }
    request.id = std::move(*id);
    request.params = optionalMember(root, "params");
    return request;
}

JSONRPCNotification notificationFromValue(const JSONValue& root) {
    requireEnvelope(root);
    JSONRPCNotification notification;
    notification.method = requireMethod(root);
    const JSONValue* idVal = GetMember(root, "id");
    if (idVal != nullptr && !idVal->IsNull()) {
        throw std::runtime_error("notification must not carry an id");
    }
    notification.params = optionalMember(root, "params");
    return notification;
}

JSONRPCResponse responseFromValue(const JSONValue& root) {
    requireEnvelope(root);
    const JSONValue* idVal = GetMember(root, "id");
    auto id = idVal ? idFromValue(*idVal) : std::nullopt;
    if (!id.has_value()) {
        throw std::runtime_error("response id missing or malformed");
    }
    JSONRPCResponse response;
    response.id = std::move(*id);
    response.result = optionalMember(root, "result");
    response.error = optionalMember(root, "error");
    if (response.result.has_value() == response.error.has_value()) {
        throw std::runtime_error("response must carry exactly one of result or error");
    }
    if (response.error.has_value()) {
        const JSONValue* code = GetMember(*response.error, "code");
        const JSONValue* message = GetMember(*response.error, "message");
        if (code == nullptr || !std::holds_alternative<int64_t>(code->value) ||
            message == nullptr || !std::holds_alternative<std::string>(message->value)) {
            throw std::runtime_error("error object requires integer code and string message");
        }
    }
    return response;
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::string out;
    appendValue(out, value);
    return out;
}

const JSONValue* GetMember(const JSONValue& value, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::string IdToString(const JSONRPCId& id) {
    std::string out;
    appendId(out, id);
    return out;
}

JSONRPCInboundMessage ParseMessage(const std::string& line) {
    FUNC_SCOPE();
    JSONValue root = ParseJSON(line);
    requireEnvelope(root);
    if (GetMember(root, "method") != nullptr) {
        const JSONValue* idVal = GetMember(root, "id");
        if (idVal != nullptr && !idVal->IsNull()) {
            return requestFromValue(root);
        }
        return notificationFromValue(root);
    }
    if (GetMember(root, "result") != nullptr || GetMember(root, "error") != nullptr) {
        return responseFromValue(root);
    }
    throw std::runtime_error("message is neither a request, a response nor a notification");
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out += "}";
    return out;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        *this = requestFromValue(ParseJSON(json));
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"id\":";
    appendId(out, id);
    if (error.has_value()) {
        out += ",\"error\":";
        appendValue(out, error.value());
    } else {
        out += ",\"result\":";
        appendValue(out, result.has_value() ? result.value() : JSONValue{});
    }
    out += "}";
    return out;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        *this = responseFromValue(ParseJSON(json));
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":";
    appendEscaped(out, jsonrpc);
    out += ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        appendValue(out, params.value());
    }
    out += "}";
    return out;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        *this = notificationFromValue(ParseJSON(json));
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int64_t code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(code);
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int64_t code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcphost
