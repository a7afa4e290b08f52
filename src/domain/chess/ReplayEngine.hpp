#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/chess/GameState.hpp"
#include "domain/domain_model.hpp"

namespace pgnreplay::domain::chess {

// One side's move taken from a MoveRecord.
struct HalfMove {
    std::size_t recordIndex{0};
    Side        side{Side::White};
    std::string token;
};

// Steps through the active game one half-move at a time.
//
// Cursor: 0 is the starting position, i + 0.5 is just after White's move of
// record i, i + 1 just after Black's move of record i (record indices 0-based).
// The board always equals a fresh replay of every half-move before the cursor.
//
// All navigation is total: out-of-range steps are no-ops.
class ReplayEngine {
public:
    ReplayEngine() = default;

    // Replaces the whole state; the cursor goes back to 0.
    void loadGame(const Game& game);
    void loadGame(const GameMetadata& metadata, std::vector<MoveRecord> moves);

    void first();
    void previous();
    void next();
    void last();

    // Re-derives the board at `cursor`, rounded down to a reachable position and clamped.
    void jumpTo(double cursor);

    double cursor() const { return cursorAt(state_.ply); }
    bool hasPreviousMove() const { return state_.ply > 0; }
    bool hasNextMove() const { return state_.ply < halves_.size(); }

    PositionSnapshot currentPosition() const;
    const GameState& state() const { return state_; }

    std::size_t halfMoveCount() const { return halves_.size(); }
    const std::vector<HalfMove>& halfMoves() const { return halves_; }

    // Cursor value after `ply` half-moves have been applied.
    double cursorAt(std::size_t ply) const;

    // Half-moves of the current replay that could not be applied.
    const std::vector<UnresolvedMove>& unresolvedMoves() const { return unresolved_; }

    // PGN text of the active game up to `cursor` (tags, no result).
    std::string movesUpTo(double cursor) const;

private:
    void replayTo(std::size_t ply);
    void applyHalf(std::size_t index);

    GameState                   state_;
    std::vector<HalfMove>       halves_;
    std::vector<UnresolvedMove> unresolved_;
};

// Full PGN of the state's game (tags, every move record, result).
std::string serialize(const GameState& state);

} // namespace pgnreplay::domain::chess
