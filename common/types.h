#pragma once

#include <cstdint>
#include <string_view>

namespace Common {

/// Visibility rungs of a Rust item, totally ordered from least to most exposed.
enum class VisibilityRung : uint8_t {
    PRIVATE = 0,        // no modifier, pub(self)
    MODULE_SCOPED = 1,  // pub(super), pub(in path)
    UNIT_SCOPED = 2,    // pub(crate)
    PUBLIC = 3          // pub
};

/// File classification produced by the classification map.
enum class Classification : uint8_t {
    CORE = 0,
    BOUNDARY = 1
};

[[nodiscard]] constexpr auto rungValue(VisibilityRung rung) noexcept -> uint8_t {
    return static_cast<uint8_t>(rung);
}

[[nodiscard]] constexpr auto rungExceeds(VisibilityRung actual, VisibilityRung ceiling) noexcept -> bool {
    return rungValue(actual) > rungValue(ceiling);
}

/// Spelling used in policy documents and diagnostics.
[[nodiscard]] constexpr auto rungToString(VisibilityRung rung) noexcept -> const char* {
    switch (rung) {
        case VisibilityRung::PRIVATE:       return "private";
        case VisibilityRung::MODULE_SCOPED: return "pub(super)";
        case VisibilityRung::UNIT_SCOPED:   return "pub(crate)";
        case VisibilityRung::PUBLIC:        return "pub";
    }
    return "private";
}

/// Parse a ceiling spelling from a policy document. Returns false when the
/// spelling is outside the fixed enumeration.
[[nodiscard]] inline auto parseRung(std::string_view text, VisibilityRung* rung) noexcept -> bool {
    if (text == "private")    { *rung = VisibilityRung::PRIVATE;       return true; }
    if (text == "pub(super)") { *rung = VisibilityRung::MODULE_SCOPED; return true; }
    if (text == "pub(crate)") { *rung = VisibilityRung::UNIT_SCOPED;   return true; }
    if (text == "pub")        { *rung = VisibilityRung::PUBLIC;        return true; }
    return false;
}

[[nodiscard]] constexpr auto classificationToString(Classification c) noexcept -> const char* {
    return c == Classification::CORE ? "core" : "boundary";
}

[[nodiscard]] inline auto parseClassification(std::string_view text, Classification* c) noexcept -> bool {
    if (text == "core")     { *c = Classification::CORE;     return true; }
    if (text == "boundary") { *c = Classification::BOUNDARY; return true; }
    return false;
}

} // namespace Common
