#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"

namespace ArchGate {

/// Kind of a top-level or inline-module item
enum class DeclKind : uint8_t {
    AGGREGATE = 0,      // struct, union
    ENUMERATION = 1,
    INTERFACE = 2,      // trait
    FUNCTION = 3,
    IMPL_BLOCK = 4,
    INLINE_MODULE = 5,
    TYPE_ALIAS = 6
};

enum class MemberKind : uint8_t {
    FIELD = 0,            // named aggregate field
    SLOT = 1,             // positional aggregate slot
    VARIANT = 2,          // enumeration variant
    METHOD = 3,           // fn inside an impl block or trait
    ASSOCIATED_ITEM = 4   // associated type or const
};

/// Direct member of a declaration (brace depth 1 of its body).
struct Member {
    MemberKind kind{MemberKind::FIELD};
    std::string name;        // slot index for positional slots
    Common::VisibilityRung visibility{Common::VisibilityRung::PRIVATE};
    std::string text;        // field/slot type, variant payload, method signature
    uint32_t line{0};
};

struct Declaration {
    DeclKind kind{DeclKind::FUNCTION};
    std::string name;              // self type for impl blocks
    Common::VisibilityRung visibility{Common::VisibilityRung::PRIVATE};
    uint32_t line{0};              // 1-based
    std::string header;            // whitespace-collapsed header text
    uint32_t nesting{0};           // inline-module depth
    std::string module_path;       // enclosing inline modules, "a::b"

    bool is_tuple{false};          // positional aggregate
    std::string self_type;         // impl blocks
    std::string interface_name;    // impl blocks; empty when inherent

    std::vector<Member> members;

    [[nodiscard]] auto isInherentImpl() const noexcept -> bool {
        return kind == DeclKind::IMPL_BLOCK && interface_name.empty();
    }
    [[nodiscard]] auto isInterfaceImpl() const noexcept -> bool {
        return kind == DeclKind::IMPL_BLOCK && !interface_name.empty();
    }
};

/// Declarations of one file in source order, inline modules flattened.
struct FileScan {
    std::vector<Declaration> declarations;
    uint32_t line_count{0};
};

/// Grammar-bounded structural scan of comment-stripped source. Tracks
/// brace, paren and bracket depth per character; it does not parse
/// expressions or types.
class StructuralScanner {
public:
    [[nodiscard]] static auto scan(const std::vector<std::string>& stripped_lines) -> FileScan;

    /// `pub` -> PUBLIC, `pub(crate)` -> UNIT_SCOPED, `pub(super)` and
    /// `pub(in path)` -> MODULE_SCOPED, `pub(self)` or nothing -> PRIVATE.
    [[nodiscard]] static auto parseVisibility(std::string_view modifier) noexcept -> Common::VisibilityRung;

    /// Last path segment of a type without generics or reference sigils:
    /// `&'a mut crate::x::Mode<T>` -> `Mode`.
    [[nodiscard]] static auto baseTypeName(std::string_view type_text) -> std::string;

    StructuralScanner() = delete;
};

[[nodiscard]] auto declKindToString(DeclKind kind) noexcept -> const char*;

} // namespace ArchGate
