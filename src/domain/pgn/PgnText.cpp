#include "domain/pgn/PgnText.hpp"

#include <cctype>

namespace pgnreplay::domain::pgn {

namespace {

static inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool isBlank(std::string_view s) {
    for (char c : s) {
        if (!isSpace(c)) return false;
    }
    return true;
}

std::string trim(std::string_view v) {
    size_t b = 0;
    while (b < v.size() && isSpace(v[b])) ++b;
    size_t e = v.size();
    while (e > b && isSpace(v[e - 1])) --e;
    return std::string(v.substr(b, e - b));
}

std::string normalizePgnText(std::string_view text) {
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t i = 0;
    while (i < text.size()) {
        size_t j = text.find('\n', i);
        if (j == std::string_view::npos) j = text.size();
        lines.emplace_back(text.substr(i, j - i));
        i = j + 1;
    }
    return lines;
}

std::string removeCommentsAndVariations(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    int brace = 0;
    int paren = 0;
    bool inLineComment = false;
    bool atLineStart = true;
    for (size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (inLineComment) {
            if (c == '\n') {
                inLineComment = false;
                atLineStart = true;
                out.push_back(' ');
            }
            continue;
        }
        if (brace > 0) {
            // Braces do not nest in PGN, but tolerate it.
            if (c == '{') ++brace;
            else if (c == '}') --brace;
            if (brace == 0) out.push_back(' ');
            continue;
        }
        if (paren > 0) {
            if (c == '(') ++paren;
            else if (c == ')') --paren;
            if (paren == 0) out.push_back(' ');
            continue;
        }
        if (c == ';' || (c == '%' && atLineStart)) {
            inLineComment = true;
            continue;
        }
        if (c == '{') { brace = 1; continue; }
        if (c == '(') { paren = 1; continue; }

        atLineStart = (c == '\n');
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> tokens;
    std::string cur;
    cur.reserve(16);
    for (char c : text) {
        if (isSpace(c)) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::string escapePgnString(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string unescapePgnString(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
            const char n = v[i + 1];
            if (n == '\\' || n == '"') {
                out.push_back(n);
                ++i;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

} // namespace pgnreplay::domain::pgn
