#include "source_text.h"

namespace ArchGate {

namespace {

// Byte length of the UTF-8 sequence introduced by `lead`
auto utf8Length(unsigned char lead) noexcept -> size_t {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

// Blanked literal content: newlines survive so line numbers hold
inline void blank(std::string& out, char c) {
    out.push_back(c == '\n' ? '\n' : ' ');
}

// `r"`, `r#"`, `br"`, `br#"` at `i` (pointing at the 'r')
auto rawStringHashes(std::string_view s, size_t i, size_t* hashes) noexcept -> bool {
    if (s[i] != 'r') {
        return false;
    }
    if (i > 0) {
        char prev = s[i - 1];
        if (prev == 'b') {
            if (i > 1 && isIdentChar(s[i - 2])) {
                return false;
            }
        } else if (isIdentChar(prev)) {
            return false;
        }
    }
    size_t j = i + 1;
    size_t n = 0;
    while (j < s.size() && s[j] == '#') {
        ++n;
        ++j;
    }
    if (j < s.size() && s[j] == '"') {
        *hashes = n;
        return true;
    }
    return false;
}

} // namespace

auto stripSource(std::string_view s) -> std::vector<std::string> {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const char c = s[i];

        // Line comment (doc comments included)
        if (c == '/' && i + 1 < n && s[i + 1] == '/') {
            while (i < n && s[i] != '\n') ++i;
            continue;
        }

        // Block comment, nestable
        if (c == '/' && i + 1 < n && s[i + 1] == '*') {
            int depth = 1;
            i += 2;
            out.push_back(' ');
            while (i < n && depth > 0) {
                if (s[i] == '/' && i + 1 < n && s[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (s[i] == '*' && i + 1 < n && s[i + 1] == '/') {
                    --depth;
                    i += 2;
                } else {
                    if (s[i] == '\n') out.push_back('\n');
                    ++i;
                }
            }
            continue;
        }

        // Raw string
        size_t hashes = 0;
        if (rawStringHashes(s, i, &hashes)) {
            out.push_back('r');
            out.append(hashes, '#');
            out.push_back('"');
            i += hashes + 2;
            while (i < n) {
                if (s[i] == '"') {
                    size_t k = 0;
                    while (k < hashes && i + 1 + k < n && s[i + 1 + k] == '#') ++k;
                    if (k == hashes) {
                        out.push_back('"');
                        out.append(hashes, '#');
                        i += hashes + 1;
                        break;
                    }
                }
                blank(out, s[i]);
                ++i;
            }
            continue;
        }

        // String literal
        if (c == '"') {
            out.push_back('"');
            ++i;
            while (i < n && s[i] != '"') {
                if (s[i] == '\\' && i + 1 < n) {
                    blank(out, s[i]);
                    blank(out, s[i + 1]);
                    i += 2;
                    continue;
                }
                blank(out, s[i]);
                ++i;
            }
            if (i < n) {
                out.push_back('"');
                ++i;
            }
            continue;
        }

        // Char literal or lifetime
        if (c == '\'') {
            size_t close = std::string_view::npos;
            if (i + 1 < n && s[i + 1] == '\\') {
                size_t j = i + 3;
                while (j < n && j < i + 12 && s[j] != '\'' && s[j] != '\n') ++j;
                if (j < n && s[j] == '\'') close = j;
            } else if (i + 1 < n && s[i + 1] != '\n') {
                size_t len = utf8Length(static_cast<unsigned char>(s[i + 1]));
                if (i + 1 + len < n && s[i + 1 + len] == '\'') close = i + 1 + len;
            }
            if (close != std::string_view::npos) {
                out.push_back('\'');
                out.append(1, ' ');
                out.push_back('\'');
                i = close + 1;
                continue;
            }
            out.push_back(c);  // lifetime
            ++i;
            continue;
        }

        out.push_back(c);
        ++i;
    }

    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t k = 0; k <= out.size(); ++k) {
        if (k == out.size() || out[k] == '\n') {
            size_t end = k;
            if (end > start && out[end - 1] == '\r') --end;
            lines.emplace_back(out, start, end - start);
            start = k + 1;
        }
    }
    return lines;
}

auto joinLines(const std::vector<std::string>& lines) -> std::string {
    std::string text;
    size_t total = 0;
    for (const auto& line : lines) total += line.size() + 1;
    text.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text.push_back('\n');
        text += lines[i];
    }
    return text;
}

auto trim(std::string_view text) -> std::string_view {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && (text[b] == ' ' || text[b] == '\t' || text[b] == '\n' || text[b] == '\r')) ++b;
    while (e > b && (text[e - 1] == ' ' || text[e - 1] == '\t' || text[e - 1] == '\n' || text[e - 1] == '\r')) --e;
    return text.substr(b, e - b);
}

auto collapseWhitespace(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : trim(text)) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

auto leadingIdentifier(std::string_view text) -> std::string {
    std::string_view t = trim(text);
    if (t.size() > 2 && t[0] == 'r' && t[1] == '#') {
        t.remove_prefix(2);
    }
    if (t.empty() || !(isIdentChar(t[0]) && !(t[0] >= '0' && t[0] <= '9'))) {
        return {};
    }
    size_t len = 0;
    while (len < t.size() && isIdentChar(t[len])) ++len;
    return std::string(t.substr(0, len));
}

auto containsWord(std::string_view text, std::string_view word) noexcept -> bool {
    if (word.empty()) {
        return false;
    }
    size_t pos = text.find(word);
    while (pos != std::string_view::npos) {
        bool left_ok = pos == 0 || !isIdentChar(text[pos - 1]);
        size_t after = pos + word.size();
        bool right_ok = after >= text.size() || !isIdentChar(text[after]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

} // namespace ArchGate
