#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/board/Board.hpp"
#include "domain/chess/ReplayEngine.hpp"
#include "domain/domain_model.hpp"

namespace pgnreplay::app {

class IPgnFileRepository;

struct ReplaySessionCallbacks {
    std::function<void(const std::vector<pgnreplay::domain::Game>&)>   onGamesLoaded;
    std::function<void(const pgnreplay::domain::Game&)>                onGameSelected;
    std::function<void(const pgnreplay::domain::chess::PositionSnapshot&)> onPositionChanged;
};

// Owns the games of one PGN source and the replay of the active one.
// Single owner; every call runs synchronously on the caller's thread.
class ReplaySession {
public:
    explicit ReplaySession(IPgnFileRepository* fileRepo = nullptr);

    void setCallbacks(ReplaySessionCallbacks callbacks);

    // Parses `raw` and replaces the game list. Does not select a game.
    const std::vector<pgnreplay::domain::Game>& loadText(const std::string& raw);

    // Reads the file through the repository, then loadText().
    pgnreplay::domain::OperationResult openFile(const std::string& path);

    // Writes the active game as full PGN.
    pgnreplay::domain::OperationResult saveActiveGame(const std::string& path) const;

    const std::vector<pgnreplay::domain::Game>& games() const noexcept { return games_; }

    bool selectGame(std::size_t index);
    void loadGame(const pgnreplay::domain::Game& game);

    const pgnreplay::domain::Game* activeGame() const;
    std::optional<std::size_t> activeIndex() const { return activeIndex_; }

    void first();
    void previous();
    void next();
    void last();
    void jumpTo(double cursor);

    double cursor() const { return engine_.cursor(); }
    pgnreplay::domain::chess::PositionSnapshot currentPosition() const;

    // Move context for collaborators: tags plus moves up to the cursor.
    std::string moveContext() const;
    std::string movesUpTo(double cursor) const;
    std::string serializeActiveGame() const;

    // The last `n` records up to and including the one at the cursor. At a
    // half cursor the last record carries only White's half.
    std::vector<pgnreplay::domain::MoveRecord> previousMoves(std::size_t n) const;

    const std::optional<pgnreplay::domain::Player>& whitePlayer() const noexcept { return whitePlayer_; }
    const std::optional<pgnreplay::domain::Player>& blackPlayer() const noexcept { return blackPlayer_; }

    // Interactive moves are not supported; always fails with NotImplemented.
    pgnreplay::domain::OperationResult makeMove(const pgnreplay::domain::Player& player,
                                                const pgnreplay::domain::board::Square& from,
                                                const pgnreplay::domain::board::Square& to);

    const pgnreplay::domain::chess::ReplayEngine& engine() const noexcept { return engine_; }

private:
    void activate(const pgnreplay::domain::Game& game);
    void notifyPosition(std::size_t unresolvedBefore);

    IPgnFileRepository*                       fileRepo_;
    ReplaySessionCallbacks                    callbacks_;

    std::vector<pgnreplay::domain::Game>      games_;
    std::optional<pgnreplay::domain::Game>    active_;
    std::optional<std::size_t>                activeIndex_;

    std::optional<pgnreplay::domain::Player>  whitePlayer_;
    std::optional<pgnreplay::domain::Player>  blackPlayer_;

    pgnreplay::domain::chess::ReplayEngine    engine_;
};

} // namespace pgnreplay::app
