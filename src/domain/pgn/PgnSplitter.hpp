#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pgnreplay::domain::pgn {

struct PgnSpan {
    std::size_t offset{0}; // byte offset into the normalized text
    std::string text;      // one game's tags and movetext
};

struct PgnSplitResult {
    std::vector<PgnSpan> spans;
    bool usedFallback{false}; // regex engine failed, split on "\n\n["
};

// Splits normalized (LF-only) text holding one or more games into per-game spans.
//
// A game ends at whitespace + result token followed by either a blank line and
// the next '[' or the end of input. The '[' stays with the next span, so the
// spans concatenate back to the input (whitespace-only spans are dropped).
// Without any boundary the whole text is one game.
PgnSplitResult splitPgnGames(const std::string& text);

} // namespace pgnreplay::domain::pgn
