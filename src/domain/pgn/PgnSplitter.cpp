#include "domain/pgn/PgnSplitter.hpp"

#include <regex>

#include "domain/pgn/PgnText.hpp"

namespace pgnreplay::domain::pgn {

namespace {

void pushSpan(std::vector<PgnSpan>& out, const std::string& text, size_t begin, size_t end) {
    if (end <= begin) return;
    std::string chunk = text.substr(begin, end - begin);
    if (isBlank(chunk)) return;
    out.push_back(PgnSpan{begin, std::move(chunk)});
}

std::vector<PgnSpan> splitByRegex(const std::string& text) {
    static const std::regex kBoundary(
        R"((\s+)(1-0|0-1|1/2-1/2|\*)\s*?(\n\s*\n\s*\[|$))",
        std::regex::ECMAScript);

    std::vector<PgnSpan> spans;
    size_t last = 0;
    bool matched = false;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), kBoundary);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        matched = true;

        const size_t end = static_cast<size_t>(m.position(0) + m.length(0));
        const bool opensTag = m.length(3) > 0 && end > 0 && text[end - 1] == '[';
        const size_t cut = opensTag ? end - 1 : end;

        pushSpan(spans, text, last, cut);
        last = cut;
    }

    if (!matched) {
        pushSpan(spans, text, 0, text.size());
        return spans;
    }

    if (last < text.size()) {
        pushSpan(spans, text, last, text.size());
    }
    return spans;
}

std::vector<PgnSpan> splitBySeparator(const std::string& text) {
    static const std::string kSep = "\n\n[";

    std::vector<PgnSpan> spans;
    size_t last = 0;
    size_t pos = text.find(kSep);
    while (pos != std::string::npos) {
        // Keep the blank line with the finished game, the '[' with the next one.
        const size_t cut = pos + 2;
        pushSpan(spans, text, last, cut);
        last = cut;
        pos = text.find(kSep, cut);
    }
    pushSpan(spans, text, last, text.size());
    return spans;
}

} // namespace

PgnSplitResult splitPgnGames(const std::string& text) {
    PgnSplitResult res;
    try {
        res.spans = splitByRegex(text);
    } catch (const std::regex_error&) {
        // The boundary pattern is rejected or the matcher hits its complexity limit.
        res.spans = splitBySeparator(text);
        res.usedFallback = true;
    }
    return res;
}

} // namespace pgnreplay::domain::pgn
