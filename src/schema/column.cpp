#include "schema/column.hpp"

#include <algorithm>
#include <cctype>

namespace strata::schema {
namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Length of the quoted run starting at s[0], doubled quotes included.
size_t quoted_length(std::string_view s) {
    const char quote = s.front();
    size_t i = 1;
    while (i < s.size()) {
        if (s[i] == quote) {
            if (i + 1 < s.size() && s[i + 1] == quote) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return s.size();
}

// Offset of the DEFAULT keyword in a clause, skipping quoted text.
size_t find_default_keyword(std::string_view clause) {
    size_t i = 0;
    while (i < clause.size()) {
        const char c = clause[i];
        if (c == '\'' || c == '"' || c == '`') {
            i += quoted_length(clause.substr(i));
            continue;
        }
        if (is_word_char(c)) {
            size_t end = i;
            while (end < clause.size() && is_word_char(clause[end])) ++end;
            if (end - i == 7 && upper(clause.substr(i, 7)) == "DEFAULT") {
                return i;
            }
            i = end;
            continue;
        }
        ++i;
    }
    return std::string_view::npos;
}

// The single expression term following DEFAULT: a parenthesised expression,
// a quoted string or blob, a signed number, or a bare literal or keyword.
std::string_view default_term(std::string_view rest) {
    rest = trim(rest);
    if (rest.empty()) return rest;

    const char c = rest.front();
    if (c == '(') {
        int depth = 0;
        size_t i = 0;
        while (i < rest.size()) {
            const char ch = rest[i];
            if (ch == '\'' || ch == '"') {
                i += quoted_length(rest.substr(i));
                continue;
            }
            if (ch == '(') ++depth;
            if (ch == ')' && --depth == 0) return rest.substr(0, i + 1);
            ++i;
        }
        return rest;
    }
    if (c == '\'' || c == '"') {
        return rest.substr(0, quoted_length(rest));
    }
    if ((c == 'x' || c == 'X') && rest.size() > 1 && rest[1] == '\'') {
        return rest.substr(0, 1 + quoted_length(rest.substr(1)));
    }

    size_t i = 0;
    if (c == '+' || c == '-') {
        ++i;
        while (i < rest.size() && std::isspace(static_cast<unsigned char>(rest[i]))) ++i;
    }
    const size_t start = i;
    while (i < rest.size()) {
        const char ch = rest[i];
        if (is_word_char(ch) || ch == '.') {
            ++i;
        } else if ((ch == '+' || ch == '-') && i > start && (rest[i - 1] == 'e' || rest[i - 1] == 'E') &&
                   std::isdigit(static_cast<unsigned char>(rest[start]))) {
            ++i;  // exponent sign, 1e-5
        } else {
            break;
        }
    }
    return rest.substr(0, i);
}

} // namespace

bool contains_keyword(std::string_view clause, std::string_view keyword) {
    const auto haystack = upper(clause);
    const auto needle = upper(keyword);
    if (needle.empty()) return false;

    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        const bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
        const size_t end = pos + needle.size();
        const bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left_ok && right_ok) return true;
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

std::optional<std::string> Column::default_value() const {
    for (const auto& clause : constraints) {
        const auto at = find_default_keyword(clause);
        if (at == std::string_view::npos) continue;

        const auto term = default_term(std::string_view(clause).substr(at + 7));
        if (term.empty()) return std::nullopt;
        return std::string(term);
    }
    return std::nullopt;
}

bool Column::has_constraint(std::string_view keyword) const {
    return std::any_of(constraints.begin(), constraints.end(),
                       [&](const std::string& c) { return contains_keyword(c, keyword); });
}

} // namespace strata::schema
