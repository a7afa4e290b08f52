#include "app/ReplaySession.hpp"

#include <QDebug>
#include <QString>

#include "app/IPgnFileRepository.hpp"
#include "domain/pgn/PgnParser.hpp"

namespace pgnreplay::app {

using namespace pgnreplay::domain;
using pgnreplay::domain::chess::PositionSnapshot;

namespace {

OperationResult failure(ErrorKind kind, std::string error) {
    OperationResult r;
    r.ok = false;
    r.kind = kind;
    r.error = std::move(error);
    return r;
}

std::optional<Player> makePlayer(const Game& game, Side side) {
    const auto& name = (side == Side::White) ? game.metadata.white : game.metadata.black;
    if (!name) return std::nullopt;

    Player p;
    p.id = game.id + ((side == Side::White) ? "-white" : "-black");
    p.name = *name;
    p.side = side;
    return p;
}

} // namespace

ReplaySession::ReplaySession(IPgnFileRepository* fileRepo)
    : fileRepo_(fileRepo) {
}

void ReplaySession::setCallbacks(ReplaySessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

const std::vector<Game>& ReplaySession::loadText(const std::string& raw) {
    games_ = pgn::parsePgnText(raw);
    activeIndex_.reset();

    qDebug() << "Parsed PGN games:" << games_.size();
    for (const auto& g : games_) {
        for (const auto& line : g.skippedTagLines) {
            qWarning() << "Skipped malformed tag in" << QString::fromStdString(g.id) << ":"
                       << QString::fromStdString(line);
        }
    }

    if (callbacks_.onGamesLoaded) {
        callbacks_.onGamesLoaded(games_);
    }
    return games_;
}

OperationResult ReplaySession::openFile(const std::string& path) {
    if (!fileRepo_) {
        return failure(ErrorKind::UnreadableSource, "No file repository configured");
    }

    const auto read = fileRepo_->read(path);
    if (!read.ok) {
        qWarning() << "Failed to read PGN:" << QString::fromStdString(path)
                   << QString::fromStdString(read.error);
        return failure(read.kind, read.error);
    }

    qDebug() << "Opened PGN:" << QString::fromStdString(path);
    loadText(read.content);

    OperationResult r;
    r.ok = true;
    return r;
}

OperationResult ReplaySession::saveActiveGame(const std::string& path) const {
    if (!active_) {
        return failure(ErrorKind::None, "No active game");
    }
    if (!fileRepo_) {
        return failure(ErrorKind::UnreadableSource, "No file repository configured");
    }

    auto r = fileRepo_->write(path, serializeActiveGame());
    if (!r.ok) {
        qWarning() << "Failed to save game:" << QString::fromStdString(path)
                   << QString::fromStdString(r.error);
    }
    return r;
}

bool ReplaySession::selectGame(std::size_t index) {
    if (index >= games_.size()) {
        return false;
    }
    activate(games_[index]);
    activeIndex_ = index;

    if (callbacks_.onGameSelected) {
        callbacks_.onGameSelected(*active_);
    }
    notifyPosition(0);
    return true;
}

void ReplaySession::loadGame(const Game& game) {
    activate(game);
    activeIndex_.reset();
    for (std::size_t i = 0; i < games_.size(); ++i) {
        if (games_[i] == game) {
            activeIndex_ = i;
            break;
        }
    }

    if (callbacks_.onGameSelected) {
        callbacks_.onGameSelected(*active_);
    }
    notifyPosition(0);
}

const Game* ReplaySession::activeGame() const {
    return active_ ? &*active_ : nullptr;
}

void ReplaySession::activate(const Game& game) {
    active_ = game;
    engine_.loadGame(game);
    whitePlayer_ = makePlayer(game, Side::White);
    blackPlayer_ = makePlayer(game, Side::Black);

    qDebug() << "Active game:" << QString::fromStdString(game.title())
             << "records:" << game.moves.size()
             << "half-moves:" << engine_.halfMoveCount();
}

void ReplaySession::first() {
    engine_.first();
    notifyPosition(0);
}

void ReplaySession::previous() {
    engine_.previous();
    notifyPosition(engine_.unresolvedMoves().size());
}

void ReplaySession::next() {
    const auto before = engine_.unresolvedMoves().size();
    engine_.next();
    notifyPosition(before);
}

void ReplaySession::last() {
    engine_.last();
    notifyPosition(0);
}

void ReplaySession::jumpTo(double cursor) {
    engine_.jumpTo(cursor);
    notifyPosition(0);
}

PositionSnapshot ReplaySession::currentPosition() const {
    return engine_.currentPosition();
}

std::string ReplaySession::moveContext() const {
    return engine_.movesUpTo(engine_.cursor());
}

std::string ReplaySession::movesUpTo(double cursor) const {
    return engine_.movesUpTo(cursor);
}

std::string ReplaySession::serializeActiveGame() const {
    return chess::serialize(engine_.state());
}

std::vector<MoveRecord> ReplaySession::previousMoves(std::size_t n) const {
    const auto ply = engine_.state().ply;
    if (ply == 0 || n == 0) return {};

    const auto& moves = engine_.state().moves;
    const auto& lastHalf = engine_.halfMoves()[ply - 1];
    const std::size_t end = lastHalf.recordIndex + 1;
    const std::size_t begin = (end > n) ? end - n : 0;
    std::vector<MoveRecord> out(moves.begin() + static_cast<std::ptrdiff_t>(begin),
                                moves.begin() + static_cast<std::ptrdiff_t>(end));

    // Black's reply in the boundary record has not been played yet.
    if (lastHalf.side == Side::White) {
        auto& boundary = out.back();
        boundary.black.reset();
        boundary.text = pgn::renderMoveText(boundary.number, boundary.white, std::nullopt);
    }
    return out;
}

OperationResult ReplaySession::makeMove(const Player& player,
                                        const board::Square& from,
                                        const board::Square& to) {
    qWarning() << "Move entry requested by" << QString::fromStdString(player.name)
               << QString::fromStdString(from.toString()) << "->"
               << QString::fromStdString(to.toString()) << "is not supported";
    return failure(ErrorKind::NotImplemented, "Making moves is not implemented");
}

// Logs half-moves that failed since `unresolvedBefore`, then notifies.
void ReplaySession::notifyPosition(std::size_t unresolvedBefore) {
    const auto& unresolved = engine_.unresolvedMoves();
    for (std::size_t i = unresolvedBefore; i < unresolved.size(); ++i) {
        const auto& u = unresolved[i];
        qWarning() << "Unresolved move" << QString::fromStdString(u.token)
                   << "in record" << (u.recordIndex + 1) << ":"
                   << QString::fromStdString(u.error);
    }

    if (callbacks_.onPositionChanged) {
        callbacks_.onPositionChanged(engine_.currentPosition());
    }
}

} // namespace pgnreplay::app
