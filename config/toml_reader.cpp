#include "toml_reader.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace Common {

// ========== TomlValue ==========

auto TomlValue::makeString(std::string value) -> TomlValue {
    TomlValue v;
    v.type_ = Type::STRING;
    v.string_ = std::move(value);
    return v;
}

auto TomlValue::makeInteger(int64_t value) noexcept -> TomlValue {
    TomlValue v;
    v.type_ = Type::INTEGER;
    v.integer_ = value;
    return v;
}

auto TomlValue::makeFloat(double value) noexcept -> TomlValue {
    TomlValue v;
    v.type_ = Type::FLOAT;
    v.float_ = value;
    return v;
}

auto TomlValue::makeBoolean(bool value) noexcept -> TomlValue {
    TomlValue v;
    v.type_ = Type::BOOLEAN;
    v.boolean_ = value;
    return v;
}

auto TomlValue::makeArray() noexcept -> TomlValue {
    TomlValue v;
    v.type_ = Type::ARRAY;
    return v;
}

auto TomlValue::makeTable() noexcept -> TomlValue {
    return TomlValue{};
}

auto TomlValue::find(const std::string& key) const noexcept -> const TomlValue* {
    if (type_ != Type::TABLE) {
        return nullptr;
    }
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

auto TomlValue::find(const std::string& key) noexcept -> TomlValue* {
    if (type_ != Type::TABLE) {
        return nullptr;
    }
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

auto TomlValue::findPath(const std::string& dotted) const noexcept -> const TomlValue* {
    const TomlValue* node = this;
    size_t start = 0;
    while (node) {
        size_t dot = dotted.find('.', start);
        std::string key = dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        node = node->find(key);
        if (dot == std::string::npos) {
            return node;
        }
        start = dot + 1;
    }
    return nullptr;
}

auto TomlValue::insert(const std::string& key, TomlValue value) -> TomlValue* {
    if (type_ != Type::TABLE || find(key) != nullptr) {
        return nullptr;
    }
    keys_.push_back(key);
    items_.push_back(std::move(value));
    return &items_.back();
}

auto TomlValue::append(TomlValue value) -> TomlValue* {
    if (type_ != Type::ARRAY) {
        return nullptr;
    }
    items_.push_back(std::move(value));
    return &items_.back();
}

auto TomlValue::getString(const std::string& dotted, const std::string& default_value) const -> std::string {
    const TomlValue* v = findPath(dotted);
    if (!v || !v->isString()) {
        return default_value;
    }
    return v->asString();
}

auto TomlValue::getStringList(const std::string& dotted, const std::vector<std::string>& default_value) const
    -> std::vector<std::string> {
    const TomlValue* v = findPath(dotted);
    if (!v || !v->isArray()) {
        return default_value;
    }
    std::vector<std::string> out;
    for (const auto& item : v->asArray()) {
        if (item.isString()) {
            out.push_back(item.asString());
        }
    }
    return out;
}

// ========== Parser ==========

namespace {

class Parser {
public:
    Parser(const std::string& text, TomlValue* root, TomlParseError* error) noexcept
        : s_(text), root_(root), current_(root), error_(error) {}

    auto run() -> bool {
        while (true) {
            skipBlankAndComments();
            if (atEnd()) {
                return true;
            }
            char c = s_[pos_];
            if (c == '[') {
                if (!parseHeader()) return false;
            } else {
                if (!parseKeyValue(current_)) return false;
            }
            if (!expectLineEnd()) return false;
        }
    }

private:
    // ---- cursor helpers ----

    [[nodiscard]] auto atEnd() const noexcept -> bool { return pos_ >= s_.size(); }
    [[nodiscard]] auto peek(size_t ahead = 0) const noexcept -> char {
        return pos_ + ahead < s_.size() ? s_[pos_ + ahead] : '\0';
    }

    void advance() noexcept {
        if (s_[pos_] == '\n') {
            ++line_;
        }
        ++pos_;
    }

    auto fail(const std::string& message) -> bool {
        error_->line = line_;
        error_->message = message;
        return false;
    }

    void skipSpaces() noexcept {
        while (!atEnd() && (peek() == ' ' || peek() == '\t')) {
            ++pos_;
        }
    }

    void skipComment() noexcept {
        if (peek() == '#') {
            while (!atEnd() && peek() != '\n') {
                ++pos_;
            }
        }
    }

    void skipBlankAndComments() noexcept {
        while (!atEnd()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '#') {
                skipComment();
            } else {
                break;
            }
        }
    }

    auto expectLineEnd() -> bool {
        skipSpaces();
        skipComment();
        if (atEnd()) {
            return true;
        }
        if (peek() == '\r') {
            ++pos_;
        }
        if (peek() == '\n') {
            advance();
            return true;
        }
        return fail(std::string("unexpected character '") + peek() + "' after value");
    }

    // ---- keys ----

    static auto isBareKeyChar(char c) noexcept -> bool {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

    auto parseSimpleKey(std::string* key) -> bool {
        skipSpaces();
        char c = peek();
        if (c == '"') {
            return parseBasicString(key);
        }
        if (c == '\'') {
            return parseLiteralString(key);
        }
        size_t start = pos_;
        while (!atEnd() && isBareKeyChar(peek())) {
            ++pos_;
        }
        if (pos_ == start) {
            return fail("expected a key");
        }
        *key = s_.substr(start, pos_ - start);
        return true;
    }

    auto parseDottedKey(std::vector<std::string>* parts) -> bool {
        while (true) {
            std::string part;
            if (!parseSimpleKey(&part)) return false;
            parts->push_back(std::move(part));
            skipSpaces();
            if (peek() != '.') {
                return true;
            }
            ++pos_;
        }
    }

    // ---- headers ----

    auto descend(TomlValue* node, const std::string& key, std::string* reason) -> TomlValue* {
        TomlValue* child = node->find(key);
        if (!child) {
            return node->insert(key, TomlValue::makeTable());
        }
        if (child->isTable()) {
            return child;
        }
        if (child->isArray() && child->isTableArray() && child->size() > 0) {
            // Headers below an array of tables extend its last element
            return child->back();
        }
        *reason = "key '" + key + "' is not a table";
        return nullptr;
    }

    auto parseHeader() -> bool {
        ++pos_;  // '['
        bool table_array = false;
        if (peek() == '[') {
            table_array = true;
            ++pos_;
        }

        std::vector<std::string> parts;
        if (!parseDottedKey(&parts)) return false;
        skipSpaces();
        if (peek() != ']') return fail("expected ']' to close table header");
        ++pos_;
        if (table_array) {
            if (peek() != ']') return fail("expected ']]' to close array-of-tables header");
            ++pos_;
        }

        TomlValue* node = root_;
        std::string reason;
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            node = descend(node, parts[i], &reason);
            if (!node) return fail(reason);
        }

        const std::string& last = parts.back();
        if (table_array) {
            TomlValue* arr = node->find(last);
            if (!arr) {
                TomlValue fresh = TomlValue::makeArray();
                fresh.markTableArray();
                arr = node->insert(last, std::move(fresh));
            } else if (!arr->isArray() || !arr->isTableArray()) {
                return fail("key '" + last + "' is already defined and is not an array of tables");
            }
            current_ = arr->append(TomlValue::makeTable());
            return true;
        }

        TomlValue* table = node->find(last);
        if (!table) {
            table = node->insert(last, TomlValue::makeTable());
        } else if (!table->isTable()) {
            return fail("key '" + last + "' is already defined and is not a table");
        } else if (table->isHeaderDefined()) {
            return fail("table '" + last + "' is defined more than once");
        }
        table->markHeaderDefined();
        current_ = table;
        return true;
    }

    // ---- key/value ----

    auto parseKeyValue(TomlValue* target) -> bool {
        std::vector<std::string> parts;
        if (!parseDottedKey(&parts)) return false;
        skipSpaces();
        if (peek() != '=') return fail("expected '=' after key '" + parts.back() + "'");
        ++pos_;
        skipSpaces();

        TomlValue value;
        if (!parseValue(&value)) return false;

        TomlValue* node = target;
        std::string reason;
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            node = descend(node, parts[i], &reason);
            if (!node) return fail(reason);
        }
        if (!node->insert(parts.back(), std::move(value))) {
            return fail("duplicate key '" + parts.back() + "'");
        }
        return true;
    }

    // ---- values ----

    auto parseValue(TomlValue* out) -> bool {
        char c = peek();
        if (c == '"') {
            std::string str;
            bool ok = (peek(1) == '"' && peek(2) == '"') ? parseMultilineBasic(&str) : parseBasicString(&str);
            if (!ok) return false;
            *out = TomlValue::makeString(std::move(str));
            return true;
        }
        if (c == '\'') {
            std::string str;
            bool ok = (peek(1) == '\'' && peek(2) == '\'') ? parseMultilineLiteral(&str) : parseLiteralString(&str);
            if (!ok) return false;
            *out = TomlValue::makeString(std::move(str));
            return true;
        }
        if (c == '[') {
            return parseArray(out);
        }
        if (c == '{') {
            return parseInlineTable(out);
        }
        if (s_.compare(pos_, 4, "true") == 0 && !isBareKeyChar(peek(4))) {
            pos_ += 4;
            *out = TomlValue::makeBoolean(true);
            return true;
        }
        if (s_.compare(pos_, 5, "false") == 0 && !isBareKeyChar(peek(5))) {
            pos_ += 5;
            *out = TomlValue::makeBoolean(false);
            return true;
        }
        return parseScalarToken(out);
    }

    auto parseArray(TomlValue* out) -> bool {
        ++pos_;  // '['
        *out = TomlValue::makeArray();
        while (true) {
            skipBlankAndComments();
            if (atEnd()) return fail("unterminated array");
            if (peek() == ']') {
                ++pos_;
                return true;
            }
            TomlValue item;
            if (!parseValue(&item)) return false;
            out->append(std::move(item));
            skipBlankAndComments();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or ']' in array");
        }
    }

    auto parseInlineTable(TomlValue* out) -> bool {
        ++pos_;  // '{'
        *out = TomlValue::makeTable();
        skipBlankAndComments();
        if (peek() == '}') {
            ++pos_;
            return true;
        }
        while (true) {
            skipBlankAndComments();
            if (!parseKeyValue(out)) return false;
            skipBlankAndComments();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or '}' in inline table");
        }
    }

    static void appendUtf8(std::string* out, uint32_t cp) {
        if (cp < 0x80) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    auto parseEscape(std::string* out) -> bool {
        ++pos_;  // '\'
        char e = peek();
        switch (e) {
            case 'b':  out->push_back('\b'); ++pos_; return true;
            case 't':  out->push_back('\t'); ++pos_; return true;
            case 'n':  out->push_back('\n'); ++pos_; return true;
            case 'f':  out->push_back('\f'); ++pos_; return true;
            case 'r':  out->push_back('\r'); ++pos_; return true;
            case '"':  out->push_back('"');  ++pos_; return true;
            case '\\': out->push_back('\\'); ++pos_; return true;
            case 'u':
            case 'U': {
                size_t digits = (e == 'u') ? 4 : 8;
                ++pos_;
                if (pos_ + digits > s_.size()) return fail("truncated unicode escape");
                std::string hex = s_.substr(pos_, digits);
                char* end = nullptr;
                unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
                if (end != hex.c_str() + digits) return fail("invalid unicode escape");
                pos_ += digits;
                appendUtf8(out, static_cast<uint32_t>(cp));
                return true;
            }
            default:
                return fail(std::string("invalid escape '\\") + e + "'");
        }
    }

    auto parseBasicString(std::string* out) -> bool {
        ++pos_;  // '"'
        out->clear();
        while (!atEnd()) {
            char c = peek();
            if (c == '"') {
                ++pos_;
                return true;
            }
            if (c == '\n') {
                return fail("newline in basic string");
            }
            if (c == '\\') {
                if (!parseEscape(out)) return false;
                continue;
            }
            out->push_back(c);
            ++pos_;
        }
        return fail("unterminated string");
    }

    auto parseLiteralString(std::string* out) -> bool {
        ++pos_;  // '\''
        out->clear();
        while (!atEnd()) {
            char c = peek();
            if (c == '\'') {
                ++pos_;
                return true;
            }
            if (c == '\n') {
                return fail("newline in literal string");
            }
            out->push_back(c);
            ++pos_;
        }
        return fail("unterminated literal string");
    }

    auto parseMultilineBasic(std::string* out) -> bool {
        pos_ += 3;
        out->clear();
        // A newline immediately after the opening delimiter is trimmed
        if (peek() == '\r' && peek(1) == '\n') ++pos_;
        if (peek() == '\n') advance();
        while (!atEnd()) {
            if (peek() == '"' && peek(1) == '"' && peek(2) == '"') {
                pos_ += 3;
                return true;
            }
            if (peek() == '\\') {
                // Line-ending backslash swallows the newline and leading whitespace
                size_t look = pos_ + 1;
                while (look < s_.size() && (s_[look] == ' ' || s_[look] == '\t' || s_[look] == '\r')) ++look;
                if (look < s_.size() && s_[look] == '\n') {
                    pos_ = look;
                    while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n')) {
                        advance();
                    }
                    continue;
                }
                if (!parseEscape(out)) return false;
                continue;
            }
            out->push_back(peek());
            advance();
        }
        return fail("unterminated multi-line string");
    }

    auto parseMultilineLiteral(std::string* out) -> bool {
        pos_ += 3;
        out->clear();
        if (peek() == '\r' && peek(1) == '\n') ++pos_;
        if (peek() == '\n') advance();
        while (!atEnd()) {
            if (peek() == '\'' && peek(1) == '\'' && peek(2) == '\'') {
                pos_ += 3;
                return true;
            }
            out->push_back(peek());
            advance();
        }
        return fail("unterminated multi-line literal string");
    }

    static auto looksLikeDate(const std::string& token) noexcept -> bool {
        // YYYY-MM-DD... or HH:MM:SS...
        return (token.size() >= 10 && token[4] == '-' && token[7] == '-') ||
               (token.size() >= 8 && token[2] == ':' && token[5] == ':');
    }

    auto parseScalarToken(TomlValue* out) -> bool {
        size_t start = pos_;
        while (!atEnd()) {
            char c = peek();
            if (c == ',' || c == ']' || c == '}' || c == '#' || c == '\n' || c == '\r') break;
            // Date-times may carry a single space between date and time
            if ((c == ' ' || c == '\t')) {
                std::string so_far = s_.substr(start, pos_ - start);
                if (so_far.size() == 10 && looksLikeDate(so_far) && peek(1) >= '0' && peek(1) <= '9') {
                    ++pos_;
                    continue;
                }
                break;
            }
            ++pos_;
        }
        std::string token = s_.substr(start, pos_ - start);
        if (token.empty()) {
            return fail("expected a value");
        }

        if (looksLikeDate(token)) {
            *out = TomlValue::makeString(token);
            return true;
        }

        std::string cleaned;
        cleaned.reserve(token.size());
        for (char c : token) {
            if (c != '_') cleaned.push_back(c);
        }

        if (cleaned == "inf" || cleaned == "+inf" || cleaned == "-inf" ||
            cleaned == "nan" || cleaned == "+nan" || cleaned == "-nan") {
            *out = TomlValue::makeFloat(std::strtod(cleaned.c_str(), nullptr));
            return true;
        }

        int base = 10;
        std::string digits = cleaned;
        if (cleaned.size() > 2 && cleaned[0] == '0' && (cleaned[1] == 'x' || cleaned[1] == 'o' || cleaned[1] == 'b')) {
            base = cleaned[1] == 'x' ? 16 : (cleaned[1] == 'o' ? 8 : 2);
            digits = cleaned.substr(2);
        }

        bool is_float = base == 10 && cleaned.find_first_of(".eE") != std::string::npos;
        errno = 0;
        char* end = nullptr;
        if (is_float) {
            double d = std::strtod(digits.c_str(), &end);
            if (end != digits.c_str() + digits.size() || errno == ERANGE) {
                return fail("invalid float '" + token + "'");
            }
            *out = TomlValue::makeFloat(d);
            return true;
        }

        long long v = std::strtoll(digits.c_str(), &end, base);
        if (digits.empty() || end != digits.c_str() + digits.size() || errno == ERANGE) {
            return fail("invalid value '" + token + "'");
        }
        *out = TomlValue::makeInteger(static_cast<int64_t>(v));
        return true;
    }

    const std::string& s_;
    size_t pos_{0};
    size_t line_{1};
    TomlValue* root_;
    TomlValue* current_;
    TomlParseError* error_;
};

} // namespace

auto TomlReader::parse(const std::string& text, TomlValue* root, TomlParseError* error) noexcept -> bool {
    *root = TomlValue::makeTable();
    Parser parser(text, root, error);
    return parser.run();
}

auto TomlReader::parseFile(const std::filesystem::path& path, TomlValue* root, TomlParseError* error) noexcept
    -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error->line = 0;
        error->message = "cannot open file";
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), root, error);
}

} // namespace Common
