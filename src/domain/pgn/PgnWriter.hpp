#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace pgnreplay::domain::pgn {

// "[Event \"...\"]\n" lines for the tags that are present, in Seven Tag Roster order.
std::string serializeTags(const GameMetadata& metadata);

// Full PGN: tags, blank line, move records, result token, trailing newline.
// A missing Result tag is written as "*".
std::string serializeGame(const GameMetadata& metadata, const std::vector<MoveRecord>& moves);

// Tags plus the move list truncated at `cursor` (multiples of 0.5, see ReplayEngine).
// A half cursor ends with the White half of the boundary record. No result, no
// trailing newline.
std::string movesUpTo(const GameMetadata& metadata,
                      const std::vector<MoveRecord>& moves,
                      double cursor);

} // namespace pgnreplay::domain::pgn
