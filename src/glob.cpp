#include "internal.h"

#include <string>

namespace volmap {
namespace glob {

namespace {

/// Match a `[...]` class starting at pattern[pi] (just past the '[').
/// Advances @p pi past the closing ']'.
bool match_class(const std::string& pattern, size_t& pi, char ch) {
    size_t plen = pattern.size();
    bool negate = (pi < plen && (pattern[pi] == '!' || pattern[pi] == '^'));
    if (negate) ++pi;

    bool matched = false;
    while (pi < plen && pattern[pi] != ']') {
        if (pi + 2 < plen && pattern[pi + 1] == '-' && pattern[pi + 2] != ']') {
            if (ch >= pattern[pi] && ch <= pattern[pi + 2]) matched = true;
            pi += 3;
        } else {
            if (ch == pattern[pi]) matched = true;
            ++pi;
        }
    }
    if (pi < plen) ++pi; // skip ']'
    return matched != negate;
}

} // anonymous namespace

/// Match a filename against a pattern.
/// Supports `*` (any sequence), `?` (any single char) and `[...]` classes.
/// A leading `.` in @p name must be matched explicitly.
bool fnmatch(const std::string& pattern, const std::string& name) {
    if (!name.empty() && name[0] == '.' &&
        (pattern.empty() || pattern[0] != '.')) {
        return false;
    }

    size_t pi = 0, ni = 0;
    size_t plen = pattern.size(), nlen = name.size();
    size_t star_pi = std::string::npos, star_ni = 0;

    while (ni < nlen) {
        if (pi < plen && pattern[pi] == '*') {
            star_pi = ++pi;
            star_ni = ni;
            continue;
        }
        if (pi < plen && pattern[pi] == '?') {
            ++pi; ++ni;
            continue;
        }
        if (pi < plen && pattern[pi] == '[') {
            size_t next = pi + 1;
            if (match_class(pattern, next, name[ni])) {
                pi = next; ++ni;
                continue;
            }
        } else if (pi < plen && pattern[pi] == name[ni]) {
            ++pi; ++ni;
            continue;
        }
        // Mismatch: let the last star swallow one more character
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        ni = ++star_ni;
    }

    while (pi < plen && pattern[pi] == '*') ++pi;
    return pi == plen;
}

} // namespace glob
} // namespace volmap
