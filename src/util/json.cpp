// TALLY - JSON Values Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/util/json.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tally {
namespace util {

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// Accessors
// ============================================================================

JSONValue JSONValue::FromNumberText(const std::string& text) {
    JSONValue value;
    bool isFloat = text.find_first_of(".eE") != std::string::npos;
    if (isFloat) {
        value.type_ = Type::Double;
        value.doubleValue_ = std::stod(text);
    } else {
        value.type_ = Type::Int;
        value.intValue_ = std::stoll(text);
    }
    value.stringValue_ = text;
    return value;
}

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

std::string JSONValue::GetNumberText() const {
    if (!IsNumber()) {
        return "";
    }
    if (!stringValue_.empty()) {
        return stringValue_;
    }
    if (type_ == Type::Int) {
        return std::to_string(intValue_);
    }
    std::ostringstream ss;
    ss << std::setprecision(15) << doubleValue_;
    return ss.str();
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

std::string JSONQuote(const std::string& str) {
    std::ostringstream ss;
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

} // namespace

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::Double:
            ss << std::setprecision(15) << doubleValue_;
            break;

        case Type::String:
            ss << JSONQuote(stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << (pretty ? "[\n" : "[");
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (pretty) ss << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
                if (i + 1 < arrayValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "]";
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << (pretty ? "{\n" : "{");
            size_t i = 0;
            for (const auto& [key, value] : objectValue_) {
                if (pretty) ss << childIndent;
                ss << JSONQuote(key) << (pretty ? ": " : ":")
                   << value.ToJSON(pretty, indent + 1);
                if (++i < objectValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "}";
            break;
        }
    }

    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

constexpr int MAX_DEPTH = 64;

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != text_.size()) return std::nullopt;
        return value;
    }

private:
    const std::string& text_;
    size_t pos_{0};

    void SkipWhitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    static void AppendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        return value;
    }

    std::optional<std::string> ParseString() {
        if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string result;
        while (pos_ < text_.size() && text_[pos_] != '"') {
            char c = text_[pos_++];
            if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= text_.size()) return std::nullopt;
            switch (text_[pos_++]) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    auto cp = ParseHex4();
                    if (!cp) return std::nullopt;
                    uint32_t code = *cp;
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!Consume("\\u")) return std::nullopt;
                        auto low = ParseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    AppendUtf8(result, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos_ >= text_.size()) return std::nullopt;
        ++pos_;
        return result;
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        if (text_[pos_] == '-') ++pos_;

        size_t digits = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ == digits) return std::nullopt;

        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            size_t frac = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            if (pos_ == frac) return std::nullopt;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            size_t exp = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            if (pos_ == exp) return std::nullopt;
        }

        try {
            return JSONValue::FromNumberText(text_.substr(start, pos_ - start));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }

        while (true) {
            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            arr.push_back(std::move(*value));

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }

        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            obj[*key] = std::move(*value);

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= text_.size()) return std::nullopt;

        char c = text_[pos_];
        if (c == 'n') return Consume("null") ? std::optional<JSONValue>(JSONValue()) : std::nullopt;
        if (c == 't') return Consume("true") ? std::optional<JSONValue>(JSONValue(true)) : std::nullopt;
        if (c == 'f') return Consume("false") ? std::optional<JSONValue>(JSONValue(false)) : std::nullopt;
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();
        return std::nullopt;
    }
};

} // namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Parser parser(json);
    return parser.ParseDocument();
}

} // namespace util
} // namespace tally
