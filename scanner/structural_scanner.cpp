#include "structural_scanner.h"

#include <algorithm>
#include <regex>

#include "scanner/source_text.h"

namespace ArchGate {

using Common::VisibilityRung;

namespace {

// Anchored item header: visibility, qualifiers, keyword
const std::regex& declarationPattern() {
    static const std::regex pattern(
        R"(^(pub(?:\s*\(\s*(?:crate|self|super|in\s[^)]*)\s*\))?\s+)?)"
        R"(((?:(?:const|async|unsafe|default|auto|extern(?:\s+"[^"]*")?)\s+)*))"
        R"((struct|union|enum|trait|fn|impl|mod|type)\b)");
    return pattern;
}

const std::regex& associatedConstPattern() {
    static const std::regex pattern(
        R"(^(pub(?:\s*\(\s*(?:crate|self|super|in\s[^)]*)\s*\))?\s+)?const\s+([A-Za-z_][A-Za-z0-9_]*)\s*:)");
    return pattern;
}

const std::regex& visibilityPrefixPattern() {
    static const std::regex pattern(R"(^pub(?:\s*\(\s*(?:crate|self|super|in\s[^)]*)\s*\))?)");
    return pattern;
}

constexpr size_t NPOS = std::string::npos;

/// Character-level walker over a whole stripped file.
class BodyWalker {
public:
    explicit BodyWalker(const std::string& text) : text_(text) {
        line_starts_.push_back(0);
        for (size_t i = 0; i < text_.size(); ++i) {
            if (text_[i] == '\n') line_starts_.push_back(i + 1);
        }
    }

    struct Item {
        size_t start{0};        // first character after attributes
        size_t header_end{0};   // '{' or ';' or end
        size_t body_begin{0};
        size_t body_end{0};
        size_t next{0};
        bool has_body{false};
        bool cfg_test{false};
    };

    [[nodiscard]] auto text() const noexcept -> const std::string& { return text_; }

    [[nodiscard]] auto lineAt(size_t pos) const noexcept -> uint32_t {
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), pos);
        return static_cast<uint32_t>(it - line_starts_.begin());
    }

    [[nodiscard]] auto skipSpace(size_t pos, size_t end) const noexcept -> size_t {
        while (pos < end && (text_[pos] == ' ' || text_[pos] == '\t' || text_[pos] == '\n' || text_[pos] == '\r')) {
            ++pos;
        }
        return pos;
    }

    /// Index of the bracket closing the one at `open`, or `end`.
    [[nodiscard]] auto matchClose(size_t open, size_t end) const noexcept -> size_t {
        const char o = text_[open];
        const char c = o == '{' ? '}' : (o == '(' ? ')' : ']');
        int depth = 0;
        for (size_t i = open; i < end; ++i) {
            if (text_[i] == o) {
                ++depth;
            } else if (text_[i] == c && --depth == 0) {
                return i;
            }
        }
        return end;
    }

    /// Skip `#[..]` and `#![..]` attributes; reports `#[cfg(test)]`.
    [[nodiscard]] auto skipAttributes(size_t pos, size_t end, bool* cfg_test) const -> size_t {
        pos = skipSpace(pos, end);
        while (pos < end && text_[pos] == '#') {
            size_t j = pos + 1;
            if (j < end && text_[j] == '!') ++j;
            j = skipSpace(j, end);
            if (j >= end || text_[j] != '[') {
                break;
            }
            size_t close = matchClose(j, end);
            std::string attr = collapseWhitespace(std::string_view(text_).substr(j + 1, close - j - 1));
            attr.erase(std::remove(attr.begin(), attr.end(), ' '), attr.end());
            if (attr == "cfg(test)") {
                *cfg_test = true;
            }
            pos = skipSpace(close + 1, end);
        }
        return pos;
    }

    /// Next item between `pos` and `end`: split at ';' or at a block close.
    [[nodiscard]] auto nextItem(size_t pos, size_t end, Item* item) const -> bool {
        for (;;) {
            pos = skipSpace(pos, end);
            if (pos < end && text_[pos] == ';') {
                ++pos;
                continue;
            }
            break;
        }
        if (pos >= end) {
            return false;
        }

        *item = Item{};
        item->start = skipAttributes(pos, end, &item->cfg_test);
        if (item->start >= end) {
            return false;
        }

        int depth = 0;  // parens and brackets
        for (size_t i = item->start; i < end; ++i) {
            const char c = text_[i];
            if (c == '(' || c == '[') {
                ++depth;
            } else if ((c == ')' || c == ']') && depth > 0) {
                --depth;
            } else if (depth == 0 && c == ';') {
                item->header_end = i;
                item->next = i + 1;
                return true;
            } else if (depth == 0 && c == '{') {
                item->header_end = i;
                item->has_body = true;
                item->body_begin = i + 1;
                item->body_end = matchClose(i, end);
                item->next = std::min(item->body_end + 1, end);
                return true;
            } else if (depth == 0 && c == '}') {
                // Stray close brace of an unbalanced body
                item->header_end = i;
                item->next = i + 1;
                return true;
            }
        }
        item->header_end = end;
        item->next = end;
        return true;
    }

    /// Top-level comma-separated elements of [begin, end). Angle brackets
    /// count only after an identifier, so `->` and shifts stay inert.
    [[nodiscard]] auto splitElements(size_t begin, size_t end) const -> std::vector<std::pair<size_t, size_t>> {
        std::vector<std::pair<size_t, size_t>> out;
        int paren = 0;
        int bracket = 0;
        int brace = 0;
        int angle = 0;
        size_t start = begin;
        for (size_t i = begin; i < end; ++i) {
            const char c = text_[i];
            switch (c) {
                case '(': ++paren; break;
                case ')': if (paren > 0) --paren; break;
                case '[': ++bracket; break;
                case ']': if (bracket > 0) --bracket; break;
                case '{': ++brace; break;
                case '}': if (brace > 0) --brace; break;
                case '<':
                    if (opensGeneric(i)) ++angle;
                    break;
                case '>':
                    if (angle > 0 && i > 0 && text_[i - 1] != '-' && text_[i - 1] != '=') --angle;
                    break;
                case ',':
                    if (paren == 0 && bracket == 0 && brace == 0 && angle == 0) {
                        out.emplace_back(start, i);
                        start = i + 1;
                    }
                    break;
                default:
                    break;
            }
        }
        out.emplace_back(start, end);

        // Drop empty elements (trailing commas)
        out.erase(std::remove_if(out.begin(), out.end(),
                                 [this](const auto& r) {
                                     return trim(std::string_view(text_).substr(r.first, r.second - r.first))
                                         .empty();
                                 }),
                  out.end());
        return out;
    }

private:
    [[nodiscard]] auto opensGeneric(size_t i) const noexcept -> bool {
        if (i == 0) return false;
        size_t j = i;
        if (text_[j - 1] == ':') return true;  // turbofish
        size_t token_end = j;
        while (j > 0 && isIdentChar(text_[j - 1])) --j;
        if (j == token_end) return false;
        return !(text_[j] >= '0' && text_[j] <= '9');
    }

    const std::string& text_;
    std::vector<size_t> line_starts_;
};

/// Split a leading visibility modifier off `element`.
auto splitVisibility(std::string_view element, VisibilityRung* rung) -> std::string_view {
    std::string_view t = trim(element);
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(t.begin(), t.end(), m, visibilityPrefixPattern(),
                          std::regex_constants::match_continuous)) {
        const size_t len = static_cast<size_t>(m.length(0));
        // `pub` must be a whole word
        if (len == t.size() || !isIdentChar(t[len])) {
            *rung = StructuralScanner::parseVisibility(t.substr(0, len));
            return trim(t.substr(len));
        }
    }
    *rung = VisibilityRung::PRIVATE;
    return t;
}

/// Trait or impl header after `impl`: generics, optional `Trait for`, self type.
void parseImplHeader(std::string_view rest, std::string* self_type, std::string* interface_name) {
    std::string text = collapseWhitespace(rest);

    // Leading generic parameters
    if (!text.empty() && text[0] == '<') {
        int depth = 0;
        size_t i = 0;
        for (; i < text.size(); ++i) {
            if (text[i] == '<') {
                ++depth;
            } else if (text[i] == '>' && (i == 0 || text[i - 1] != '-')) {
                if (--depth == 0) break;
            }
        }
        text = collapseWhitespace(std::string_view(text).substr(std::min(i + 1, text.size())));
    }

    // Where clause
    static const std::regex where_clause(R"(\bwhere\b)");
    std::smatch wm;
    if (std::regex_search(text, wm, where_clause)) {
        text = collapseWhitespace(std::string_view(text).substr(0, static_cast<size_t>(wm.position(0))));
    }

    // `for` at angle depth zero marks an interface implementation
    int depth = 0;
    size_t for_pos = NPOS;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '<') {
            ++depth;
        } else if (text[i] == '>' && depth > 0 && (i == 0 || text[i - 1] != '-')) {
            --depth;
        } else if (depth == 0 && text.compare(i, 3, "for") == 0 && (i == 0 || !isIdentChar(text[i - 1])) &&
                   i + 3 < text.size() && text[i + 3] == ' ') {
            for_pos = i;
            break;
        }
    }

    if (for_pos == NPOS) {
        *self_type = StructuralScanner::baseTypeName(text);
        interface_name->clear();
    } else {
        std::string_view iface = trim(std::string_view(text).substr(0, for_pos));
        if (!iface.empty() && iface[0] == '!') iface.remove_prefix(1);
        *interface_name = StructuralScanner::baseTypeName(iface);
        *self_type = StructuralScanner::baseTypeName(std::string_view(text).substr(for_pos + 4));
    }
}

class FileScanner {
public:
    explicit FileScanner(const std::string& text) : walker_(text) {}

    void scanItems(size_t begin, size_t end, uint32_t nesting, const std::string& module_path,
                   std::vector<Declaration>* out) {
        BodyWalker::Item item;
        size_t pos = begin;
        while (walker_.nextItem(pos, end, &item)) {
            pos = item.next;
            if (item.header_end <= item.start) {
                continue;
            }

            const std::string& text = walker_.text();
            const std::string header(text, item.start, item.header_end - item.start);
            std::smatch m;
            if (!std::regex_search(header, m, declarationPattern(), std::regex_constants::match_continuous)) {
                continue;
            }

            Declaration decl;
            decl.visibility = m[1].matched ? StructuralScanner::parseVisibility(trim(m[1].str()))
                                           : VisibilityRung::PRIVATE;
            decl.line = walker_.lineAt(item.start);
            decl.header = collapseWhitespace(header);
            decl.nesting = nesting;
            decl.module_path = module_path;

            const std::string keyword = m[3].str();
            const size_t rest_pos = walker_.skipSpace(item.start + static_cast<size_t>(m.position(3) + m.length(3)),
                                                      item.header_end);
            const std::string_view rest = std::string_view(text).substr(rest_pos, item.header_end - rest_pos);

            if (keyword == "impl") {
                decl.kind = DeclKind::IMPL_BLOCK;
                parseImplHeader(rest, &decl.self_type, &decl.interface_name);
                decl.name = decl.self_type;
                if (item.has_body) {
                    scanAssociatedItems(item, decl.interface_name.empty(), &decl);
                }
                out->push_back(std::move(decl));
                continue;
            }

            decl.name = leadingIdentifier(rest);
            if (decl.name.empty()) {
                continue;
            }

            if (keyword == "struct" || keyword == "union") {
                decl.kind = DeclKind::AGGREGATE;
                if (item.has_body) {
                    scanFields(item.body_begin, item.body_end, &decl);
                } else {
                    scanSlots(rest_pos, item.header_end, &decl);
                }
            } else if (keyword == "enum") {
                decl.kind = DeclKind::ENUMERATION;
                if (item.has_body) {
                    scanVariants(item.body_begin, item.body_end, &decl);
                }
            } else if (keyword == "trait") {
                decl.kind = DeclKind::INTERFACE;
                if (item.has_body) {
                    scanAssociatedItems(item, true, &decl);
                }
            } else if (keyword == "fn") {
                decl.kind = DeclKind::FUNCTION;
            } else if (keyword == "type") {
                decl.kind = DeclKind::TYPE_ALIAS;
            } else {
                decl.kind = DeclKind::INLINE_MODULE;
                if (item.cfg_test) {
                    continue;
                }
                const std::string name = decl.name;
                const bool inline_body = item.has_body;
                out->push_back(std::move(decl));
                if (inline_body) {
                    const std::string child_path = module_path.empty() ? name : module_path + "::" + name;
                    scanItems(item.body_begin, item.body_end, nesting + 1, child_path, out);
                }
                continue;
            }
            out->push_back(std::move(decl));
        }
    }

private:
    // Named fields: `[vis] name: Type`
    void scanFields(size_t begin, size_t end, Declaration* decl) {
        for (const auto& [b, e] : walker_.splitElements(begin, end)) {
            bool ignored = false;
            size_t start = walker_.skipAttributes(b, e, &ignored);
            if (start >= e) continue;
            std::string_view element = std::string_view(walker_.text()).substr(start, e - start);

            Member member;
            member.kind = MemberKind::FIELD;
            std::string_view body = splitVisibility(element, &member.visibility);
            member.name = leadingIdentifier(body);
            if (member.name.empty()) continue;
            size_t colon = body.find(':');
            if (colon == std::string_view::npos) continue;
            member.text = collapseWhitespace(body.substr(colon + 1));
            member.line = walker_.lineAt(start);
            decl->members.push_back(std::move(member));
        }
    }

    // Positional slots from the parenthesised list after name and generics
    void scanSlots(size_t rest_pos, size_t header_end, Declaration* decl) {
        const std::string& text = walker_.text();
        size_t q = rest_pos;
        while (q < header_end && isIdentChar(text[q])) ++q;
        q = walker_.skipSpace(q, header_end);
        if (q < header_end && text[q] == '<') {
            int depth = 0;
            for (; q < header_end; ++q) {
                if (text[q] == '<') {
                    ++depth;
                } else if (text[q] == '>' && text[q - 1] != '-') {
                    if (--depth == 0) {
                        ++q;
                        break;
                    }
                }
            }
            q = walker_.skipSpace(q, header_end);
        }
        if (q >= header_end || text[q] != '(') {
            return;  // unit aggregate
        }
        decl->is_tuple = true;
        const size_t close = walker_.matchClose(q, header_end);

        uint32_t index = 0;
        for (const auto& [b, e] : walker_.splitElements(q + 1, close)) {
            bool ignored = false;
            size_t start = walker_.skipAttributes(b, e, &ignored);
            if (start >= e) continue;
            Member member;
            member.kind = MemberKind::SLOT;
            std::string_view type = splitVisibility(std::string_view(text).substr(start, e - start),
                                                    &member.visibility);
            member.name = std::to_string(index++);
            member.text = collapseWhitespace(type);
            member.line = walker_.lineAt(start);
            decl->members.push_back(std::move(member));
        }
    }

    // Variants: `Name`, `Name(..)`, `Name { .. }`, `Name = expr`
    void scanVariants(size_t begin, size_t end, Declaration* decl) {
        for (const auto& [b, e] : walker_.splitElements(begin, end)) {
            bool ignored = false;
            size_t start = walker_.skipAttributes(b, e, &ignored);
            if (start >= e) continue;
            std::string_view element = trim(std::string_view(walker_.text()).substr(start, e - start));

            Member member;
            member.kind = MemberKind::VARIANT;
            member.name = leadingIdentifier(element);
            if (member.name.empty()) continue;
            member.visibility = decl->visibility;
            size_t name_end = element.find(member.name) + member.name.size();
            member.text = collapseWhitespace(element.substr(name_end));
            member.line = walker_.lineAt(start);
            decl->members.push_back(std::move(member));
        }
    }

    // Methods and associated items of a trait or impl body
    void scanAssociatedItems(const BodyWalker::Item& owner, bool independent_visibility, Declaration* decl) {
        const bool inherent = decl->kind == DeclKind::IMPL_BLOCK && independent_visibility;
        const std::string& text = walker_.text();
        BodyWalker::Item item;
        size_t pos = owner.body_begin;
        while (walker_.nextItem(pos, owner.body_end, &item)) {
            pos = item.next;
            if (item.header_end <= item.start) continue;
            const std::string header(text, item.start, item.header_end - item.start);

            Member member;
            member.line = walker_.lineAt(item.start);
            std::smatch m;
            if (std::regex_search(header, m, declarationPattern(), std::regex_constants::match_continuous)) {
                const std::string keyword = m[3].str();
                if (keyword == "fn") {
                    member.kind = MemberKind::METHOD;
                } else if (keyword == "type") {
                    member.kind = MemberKind::ASSOCIATED_ITEM;
                } else {
                    continue;
                }
                member.name = leadingIdentifier(
                    std::string_view(header).substr(static_cast<size_t>(m.position(3) + m.length(3))));
                member.visibility = m[1].matched ? StructuralScanner::parseVisibility(trim(m[1].str()))
                                                 : VisibilityRung::PRIVATE;
            } else if (std::regex_search(header, m, associatedConstPattern(),
                                         std::regex_constants::match_continuous)) {
                member.kind = MemberKind::ASSOCIATED_ITEM;
                member.name = m[2].str();
                member.visibility = m[1].matched ? StructuralScanner::parseVisibility(trim(m[1].str()))
                                                 : VisibilityRung::PRIVATE;
            } else {
                continue;
            }
            if (member.name.empty()) continue;

            // Trait items and interface-implementation items share the trait's reach
            if (!inherent) {
                member.visibility = VisibilityRung::PUBLIC;
            }
            member.text = collapseWhitespace(header);
            decl->members.push_back(std::move(member));
        }
    }

    BodyWalker walker_;
};

} // namespace

auto StructuralScanner::scan(const std::vector<std::string>& stripped_lines) -> FileScan {
    const std::string text = joinLines(stripped_lines);
    FileScanner scanner(text);

    FileScan result;
    scanner.scanItems(0, text.size(), 0, std::string(), &result.declarations);
    result.line_count = static_cast<uint32_t>(stripped_lines.size());
    return result;
}

auto StructuralScanner::parseVisibility(std::string_view modifier) noexcept -> VisibilityRung {
    std::string_view t = trim(modifier);
    if (t.size() < 3 || t.substr(0, 3) != "pub") {
        return VisibilityRung::PRIVATE;
    }
    t.remove_prefix(3);
    t = trim(t);
    if (t.empty()) {
        return VisibilityRung::PUBLIC;
    }
    if (t.front() != '(') {
        return VisibilityRung::PUBLIC;
    }
    t.remove_prefix(1);
    if (!t.empty() && t.back() == ')') t.remove_suffix(1);
    t = trim(t);
    if (t == "crate") return VisibilityRung::UNIT_SCOPED;
    if (t == "self") return VisibilityRung::PRIVATE;
    if (t == "super") return VisibilityRung::MODULE_SCOPED;
    if (t.substr(0, 2) == "in") return VisibilityRung::MODULE_SCOPED;
    return VisibilityRung::MODULE_SCOPED;
}

auto StructuralScanner::baseTypeName(std::string_view type_text) -> std::string {
    std::string_view t = trim(type_text);
    for (;;) {
        if (!t.empty() && (t.front() == '&' || t.front() == '*')) {
            t = trim(t.substr(1));
            continue;
        }
        if (!t.empty() && t.front() == '\'') {
            size_t sp = t.find(' ');
            t = sp == std::string_view::npos ? std::string_view() : trim(t.substr(sp));
            continue;
        }
        bool stripped = false;
        for (std::string_view kw : {"mut ", "const ", "dyn ", "impl "}) {
            if (t.substr(0, kw.size()) == kw) {
                t = trim(t.substr(kw.size()));
                stripped = true;
            }
        }
        if (!stripped) break;
    }
    size_t angle = t.find('<');
    if (angle != std::string_view::npos) {
        t = t.substr(0, angle);
    }
    size_t sep = t.rfind("::");
    if (sep != std::string_view::npos) {
        t = t.substr(sep + 2);
    }
    return std::string(trim(t));
}

auto declKindToString(DeclKind kind) noexcept -> const char* {
    switch (kind) {
        case DeclKind::AGGREGATE:     return "aggregate";
        case DeclKind::ENUMERATION:   return "enumeration";
        case DeclKind::INTERFACE:     return "interface";
        case DeclKind::FUNCTION:      return "function";
        case DeclKind::IMPL_BLOCK:    return "impl";
        case DeclKind::INLINE_MODULE: return "module";
        case DeclKind::TYPE_ALIAS:    return "type alias";
    }
    return "unknown";
}

} // namespace ArchGate
