#include "chunkswarm/json/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace chunkswarm::json {

namespace {

// Largest integer a double carries without loss.
constexpr double kMaxExactInteger = 9007199254740992.0;
constexpr std::size_t kMaxDepth = 64;

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!eof()) {
            throw ParseError("Unexpected trailing data after JSON document");
        }
        return value;
    }

private:
    Value parse_value() {
        if (eof()) {
            throw ParseError("Unexpected end of JSON input");
        }
        const char ch = peek();
        if (ch == '"') {
            return Value::string(parse_string());
        }
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (ch == 't' || ch == 'f') {
            return parse_boolean();
        }
        if (ch == 'n') {
            if (!match_literal("null")) {
                throw ParseError("Invalid null literal");
            }
            return Value{};
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            return parse_number();
        }
        throw ParseError("Invalid JSON token start");
    }

    Value parse_object() {
        DepthGuard guard(*this);
        Value value = Value::object();
        expect('{');
        skip_whitespace();
        if (match('}')) {
            return value;
        }
        while (true) {
            skip_whitespace();
            if (eof() || peek() != '"') {
                throw ParseError("Expected string key in object");
            }
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            skip_whitespace();
            value.set(std::move(key), parse_value());
            skip_whitespace();
            if (match('}')) {
                break;
            }
            expect(',');
        }
        return value;
    }

    Value parse_array() {
        DepthGuard guard(*this);
        Value value = Value::array();
        expect('[');
        skip_whitespace();
        if (match(']')) {
            return value;
        }
        while (true) {
            skip_whitespace();
            value.array_value.push_back(parse_value());
            skip_whitespace();
            if (match(']')) {
                break;
            }
            expect(',');
        }
        return value;
    }

    Value parse_boolean() {
        if (match_literal("true")) {
            return Value::boolean(true);
        }
        if (match_literal("false")) {
            return Value::boolean(false);
        }
        throw ParseError("Invalid boolean literal");
    }

    Value parse_number() {
        const std::size_t start = pos_;
        match('-');
        if (match('0')) {
            // a leading zero stands alone
        } else if (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            skip_digits();
        } else {
            throw ParseError("Invalid number literal");
        }
        if (match('.')) {
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw ParseError("Invalid fractional number");
            }
            skip_digits();
        }
        if (!eof() && (peek() == 'e' || peek() == 'E')) {
            ++pos_;
            if (!eof() && (peek() == '+' || peek() == '-')) {
                ++pos_;
            }
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw ParseError("Invalid exponent in number");
            }
            skip_digits();
        }
        const std::string buffer(input_.substr(start, pos_ - start));
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(buffer.c_str(), &end);
        if (errno == ERANGE || end != buffer.c_str() + buffer.size()) {
            throw ParseError("Unable to parse number literal");
        }
        return Value::number(parsed);
    }

    std::string parse_string() {
        expect('"');
        std::string output;
        while (true) {
            if (eof()) {
                throw ParseError("Unterminated string literal");
            }
            const char ch = get();
            if (ch == '"') {
                break;
            }
            if (ch != '\\') {
                output.push_back(ch);
                continue;
            }
            if (eof()) {
                throw ParseError("Unterminated escape sequence");
            }
            const char esc = get();
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    output.push_back(esc);
                    break;
                case 'b':
                    output.push_back('\b');
                    break;
                case 'f':
                    output.push_back('\f');
                    break;
                case 'n':
                    output.push_back('\n');
                    break;
                case 'r':
                    output.push_back('\r');
                    break;
                case 't':
                    output.push_back('\t');
                    break;
                case 'u':
                    append_utf8(parse_codepoint(), output);
                    break;
                default:
                    throw ParseError("Invalid escape sequence in string");
            }
        }
        return output;
    }

    unsigned int parse_hex4() {
        if (pos_ + 4 > input_.size()) {
            throw ParseError("Truncated unicode escape");
        }
        unsigned int value = 0;
        for (const char ch : input_.substr(pos_, 4)) {
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<unsigned int>(10 + ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<unsigned int>(10 + ch - 'A');
            } else {
                throw ParseError("Invalid unicode escape");
            }
        }
        pos_ += 4;
        return value;
    }

    // Joins a UTF-16 surrogate pair when one follows.
    unsigned int parse_codepoint() {
        const unsigned int high = parse_hex4();
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        if (!match_literal("\\u")) {
            throw ParseError("Unpaired surrogate in unicode escape");
        }
        const unsigned int low = parse_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            throw ParseError("Invalid low surrogate in unicode escape");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(unsigned int codepoint, std::string& out) {
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

    struct DepthGuard {
        explicit DepthGuard(Parser& parser) : parser_(parser) {
            if (++parser_.depth_ > kMaxDepth) {
                throw ParseError("JSON nesting too deep");
            }
        }
        ~DepthGuard() { --parser_.depth_; }
        Parser& parser_;
    };

    void expect(char expected) {
        if (eof() || input_[pos_] != expected) {
            throw ParseError("Unexpected character in JSON input");
        }
        ++pos_;
    }

    bool match(char expected) {
        if (!eof() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool match_literal(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void skip_digits() {
        while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    void skip_whitespace() {
        while (!eof()) {
            const char ch = input_[pos_];
            if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    bool eof() const {
        return pos_ >= input_.size();
    }

    char peek() const {
        return input_[pos_];
    }

    char get() {
        return input_[pos_++];
    }

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

void write_string(std::string_view value, std::string& out) {
    out.push_back('"');
    for (const char ch : value) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back('"');
}

void write_number(double value, std::string& out) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    if (std::floor(value) == value && std::fabs(value) <= kMaxExactInteger) {
        out += std::to_string(static_cast<long long>(value));
        return;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    out += buffer;
}

void write_value(const Value& value, std::string& out) {
    switch (value.type) {
        case Type::Null:
            out += "null";
            return;
        case Type::Boolean:
            out += value.bool_value ? "true" : "false";
            return;
        case Type::Number:
            write_number(value.number_value, out);
            return;
        case Type::String:
            write_string(value.string_value, out);
            return;
        case Type::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : value.array_value) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                write_value(item, out);
            }
            out.push_back(']');
            return;
        }
        case Type::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, item] : value.object_value) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                write_string(key, out);
                out.push_back(':');
                write_value(item, out);
            }
            out.push_back('}');
            return;
        }
    }
}

}  // namespace

Value Value::boolean(bool value) {
    Value result;
    result.type = Type::Boolean;
    result.bool_value = value;
    return result;
}

Value Value::number(double value) {
    Value result;
    result.type = Type::Number;
    result.number_value = value;
    return result;
}

Value Value::string(std::string value) {
    Value result;
    result.type = Type::String;
    result.string_value = std::move(value);
    return result;
}

Value Value::array() {
    Value result;
    result.type = Type::Array;
    return result;
}

Value Value::object() {
    Value result;
    result.type = Type::Object;
    return result;
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& [k, value] : object_value) {
        if (k == key) {
            return &value;
        }
    }
    return nullptr;
}

Value& Value::set(std::string key, Value value) {
    for (auto& [k, existing] : object_value) {
        if (k == key) {
            existing = std::move(value);
            return existing;
        }
    }
    object_value.emplace_back(std::move(key), std::move(value));
    return object_value.back().second;
}

Value& Value::push_back(Value value) {
    array_value.push_back(std::move(value));
    return array_value.back();
}

std::optional<std::uint64_t> Value::as_unsigned() const {
    if (!is_number() || number_value < 0.0 || number_value > kMaxExactInteger
        || std::floor(number_value) != number_value) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(number_value);
}

Value parse(std::string_view input) {
    Parser parser(input);
    return parser.parse();
}

std::string serialize(const Value& value) {
    std::string out;
    write_value(value, out);
    return out;
}

}  // namespace chunkswarm::json
