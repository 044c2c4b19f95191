#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ArchGate {

/// Remove `//` and nestable `/* */` comments and blank the contents of
/// string, raw string and char literals. Delimiters stay, every newline
/// stays, so the returned lines match the input line for line. Lifetimes
/// (`'a`) are left alone.
[[nodiscard]] auto stripSource(std::string_view raw) -> std::vector<std::string>;

/// Join stripped lines back into one buffer with '\n' separators.
[[nodiscard]] auto joinLines(const std::vector<std::string>& lines) -> std::string;

/// Collapse whitespace runs into single spaces and trim both ends.
[[nodiscard]] auto collapseWhitespace(std::string_view text) -> std::string;

[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

[[nodiscard]] inline auto isIdentChar(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

/// Leading identifier of `text` (after optional whitespace), with a raw
/// identifier prefix `r#` removed. Empty when `text` does not start with one.
[[nodiscard]] auto leadingIdentifier(std::string_view text) -> std::string;

/// True when `word` occurs in `text` delimited by non-identifier characters.
[[nodiscard]] auto containsWord(std::string_view text, std::string_view word) noexcept -> bool;

} // namespace ArchGate
