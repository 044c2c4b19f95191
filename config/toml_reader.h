#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Common {

/// A parsed TOML value. Tables keep keys in document order so ordered
/// documents (classification rules) read back the way they were written.
class TomlValue {
public:
    enum class Type : uint8_t {
        STRING,
        INTEGER,
        FLOAT,
        BOOLEAN,
        ARRAY,
        TABLE
    };

    TomlValue() noexcept : type_(Type::TABLE) {}

    [[nodiscard]] static auto makeString(std::string value) -> TomlValue;
    [[nodiscard]] static auto makeInteger(int64_t value) noexcept -> TomlValue;
    [[nodiscard]] static auto makeFloat(double value) noexcept -> TomlValue;
    [[nodiscard]] static auto makeBoolean(bool value) noexcept -> TomlValue;
    [[nodiscard]] static auto makeArray() noexcept -> TomlValue;
    [[nodiscard]] static auto makeTable() noexcept -> TomlValue;

    [[nodiscard]] auto type() const noexcept -> Type { return type_; }
    [[nodiscard]] auto isString() const noexcept -> bool { return type_ == Type::STRING; }
    [[nodiscard]] auto isInteger() const noexcept -> bool { return type_ == Type::INTEGER; }
    [[nodiscard]] auto isFloat() const noexcept -> bool { return type_ == Type::FLOAT; }
    [[nodiscard]] auto isBoolean() const noexcept -> bool { return type_ == Type::BOOLEAN; }
    [[nodiscard]] auto isArray() const noexcept -> bool { return type_ == Type::ARRAY; }
    [[nodiscard]] auto isTable() const noexcept -> bool { return type_ == Type::TABLE; }

    [[nodiscard]] auto asString() const noexcept -> const std::string& { return string_; }
    [[nodiscard]] auto asInteger() const noexcept -> int64_t { return integer_; }
    [[nodiscard]] auto asFloat() const noexcept -> double { return float_; }
    [[nodiscard]] auto asBoolean() const noexcept -> bool { return boolean_; }
    [[nodiscard]] auto asArray() const noexcept -> const std::vector<TomlValue>& { return items_; }

    // ========== Table access ==========

    [[nodiscard]] auto find(const std::string& key) const noexcept -> const TomlValue*;
    [[nodiscard]] auto find(const std::string& key) noexcept -> TomlValue*;

    /// Dotted lookup through nested tables ("workspace.members").
    [[nodiscard]] auto findPath(const std::string& dotted) const noexcept -> const TomlValue*;

    /// Insert a new key; returns nullptr when the key already exists.
    auto insert(const std::string& key, TomlValue value) -> TomlValue*;

    [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }

    // ========== Array access ==========

    auto append(TomlValue value) -> TomlValue*;
    [[nodiscard]] auto back() noexcept -> TomlValue* { return items_.empty() ? nullptr : &items_.back(); }
    [[nodiscard]] auto size() const noexcept -> size_t { return items_.size(); }

    // Parser bookkeeping
    [[nodiscard]] auto isHeaderDefined() const noexcept -> bool { return header_defined_; }
    void markHeaderDefined() noexcept { header_defined_ = true; }
    [[nodiscard]] auto isTableArray() const noexcept -> bool { return table_array_; }
    void markTableArray() noexcept { table_array_ = true; }

    /// Convenience lookups with defaults, in the manner of Config::get.
    [[nodiscard]] auto getString(const std::string& dotted, const std::string& default_value) const -> std::string;
    [[nodiscard]] auto getStringList(const std::string& dotted, const std::vector<std::string>& default_value) const
        -> std::vector<std::string>;

private:
    Type type_;
    std::string string_;
    int64_t integer_{0};
    double float_{0.0};
    bool boolean_{false};
    bool header_defined_{false};
    bool table_array_{false};

    // ARRAY: items_; TABLE: keys_[i] -> items_[i]
    std::vector<std::string> keys_;
    std::vector<TomlValue> items_;
};

/// Parse failure location and reason.
struct TomlParseError {
    size_t line{0};
    std::string message;
};

/// TOML reader covering the subset used by Cargo manifests and the gate's
/// policy documents: tables, arrays of tables, dotted keys, basic/literal and
/// multi-line strings, integers, floats, booleans, arrays and inline tables.
/// Date-time values are kept as their literal text.
class TomlReader {
public:
    [[nodiscard]] static auto parse(const std::string& text, TomlValue* root, TomlParseError* error) noexcept -> bool;

    [[nodiscard]] static auto parseFile(const std::filesystem::path& path, TomlValue* root,
                                        TomlParseError* error) noexcept -> bool;

    TomlReader() = delete;
};

} // namespace Common
