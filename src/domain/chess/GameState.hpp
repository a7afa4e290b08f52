#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/board/Board.hpp"
#include "domain/domain_model.hpp"

namespace pgnreplay::domain::chess {

struct MoveHighlight {
    board::Square from;
    board::Square to;
};

inline bool operator==(const MoveHighlight& a, const MoveHighlight& b) {
    return a.from == b.from && a.to == b.to;
}

// A half-move that could not be applied during the current replay.
struct UnresolvedMove {
    std::size_t recordIndex{0};
    Side        side{Side::White};
    std::string token;
    std::string error;
};

// Live replay state of the active game. Owned by ReplayEngine.
struct GameState {
    GameMetadata            metadata;
    std::vector<MoveRecord> moves;
    board::Board            board = board::Board::startingPosition();

    // Number of half-moves applied to `board`.
    std::size_t ply{0};

    std::optional<MoveHighlight> lastMove;
};

// Read-only copy handed to renderers.
struct PositionSnapshot {
    board::Board                 board;
    double                       cursor{0.0};
    bool                         hasPrevious{false};
    bool                         hasNext{false};
    std::optional<MoveHighlight> lastMove;
};

} // namespace pgnreplay::domain::chess
