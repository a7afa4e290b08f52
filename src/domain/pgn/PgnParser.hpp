#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "domain/domain_model.hpp"

namespace pgnreplay::domain::pgn {

struct PgnGameParse {
    GameMetadata             metadata;
    std::vector<MoveRecord>  moves;
    std::vector<std::string> skippedTagLines; // MalformedTag lines, kept for diagnostics
};

// Parses one game span: recognized tag pairs plus the numbered move list.
// Never fails; unparseable parts are skipped and a partial result is returned.
PgnGameParse parsePgnGame(std::string_view gameText);

// Builds the move list from raw movetext ("1. e4 e5 2. Nf3 *").
std::vector<MoveRecord> parseMovetext(std::string_view movetext);

// Renders "12. Nf3 Nc6" / "12. Nf3".
std::string renderMoveText(int number,
                           const std::optional<std::string>& white,
                           const std::optional<std::string>& black);

// Splits raw multi-game text and parses every span into a Game with a fresh id.
std::vector<Game> parsePgnText(const std::string& rawText);

} // namespace pgnreplay::domain::pgn
