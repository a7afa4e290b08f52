#include "domain/chess/ReplayEngine.hpp"

#include "domain/chess/NotationResolver.hpp"
#include "domain/pgn/PgnWriter.hpp"

namespace pgnreplay::domain::chess {

void ReplayEngine::loadGame(const Game& game) {
    loadGame(game.metadata, game.moves);
}

void ReplayEngine::loadGame(const GameMetadata& metadata, std::vector<MoveRecord> moves) {
    state_ = GameState{};
    state_.metadata = metadata;
    state_.moves = std::move(moves);

    halves_.clear();
    unresolved_.clear();
    for (std::size_t i = 0; i < state_.moves.size(); ++i) {
        const auto& rec = state_.moves[i];
        if (rec.white) halves_.push_back(HalfMove{i, Side::White, *rec.white});
        if (rec.black) halves_.push_back(HalfMove{i, Side::Black, *rec.black});
    }
}

void ReplayEngine::first() {
    replayTo(0);
}

void ReplayEngine::previous() {
    if (!hasPreviousMove()) return;
    replayTo(state_.ply - 1);
}

void ReplayEngine::next() {
    if (!hasNextMove()) return;
    applyHalf(state_.ply);
    ++state_.ply;
}

void ReplayEngine::last() {
    replayTo(halves_.size());
}

void ReplayEngine::jumpTo(double cursor) {
    std::size_t target = 0;
    for (std::size_t p = 1; p <= halves_.size(); ++p) {
        if (cursorAt(p) > cursor) break;
        target = p;
    }
    replayTo(target);
}

double ReplayEngine::cursorAt(std::size_t ply) const {
    if (ply == 0 || halves_.empty()) return 0.0;
    if (ply > halves_.size()) ply = halves_.size();

    const auto& h = halves_[ply - 1];
    const double base = static_cast<double>(h.recordIndex);
    return (h.side == Side::White) ? base + 0.5 : base + 1.0;
}

PositionSnapshot ReplayEngine::currentPosition() const {
    PositionSnapshot snap;
    snap.board = state_.board;
    snap.cursor = cursor();
    snap.hasPrevious = hasPreviousMove();
    snap.hasNext = hasNextMove();
    snap.lastMove = state_.lastMove;
    return snap;
}

std::string ReplayEngine::movesUpTo(double cursor) const {
    return pgn::movesUpTo(state_.metadata, state_.moves, cursor);
}

void ReplayEngine::replayTo(std::size_t ply) {
    if (ply > halves_.size()) ply = halves_.size();

    state_.board = board::Board::startingPosition();
    state_.lastMove.reset();
    state_.ply = 0;
    unresolved_.clear();

    for (std::size_t i = 0; i < ply; ++i) {
        applyHalf(i);
    }
    state_.ply = ply;
}

void ReplayEngine::applyHalf(std::size_t index) {
    const auto& h = halves_[index];
    const auto res = applySanMove(state_.board, h.side, h.token);
    if (!res.ok()) {
        unresolved_.push_back(UnresolvedMove{h.recordIndex, h.side, h.token, res.error});
        return;
    }
    state_.lastMove = MoveHighlight{res.from, res.to};
}

std::string serialize(const GameState& state) {
    return pgn::serializeGame(state.metadata, state.moves);
}

} // namespace pgnreplay::domain::chess
