#include "domain/chess/NotationResolver.hpp"

#include <cstdlib>
#include <string_view>
#include <vector>

namespace pgnreplay::domain::chess {

using board::Board;
using board::Square;

namespace {

inline bool isFileChar(char c) { return c >= 'a' && c <= 'h'; }
inline bool isRankChar(char c) { return c >= '1' && c <= '8'; }

inline bool isSlider(PieceKind k) {
    return k == PieceKind::Queen || k == PieceKind::Rook || k == PieceKind::Bishop;
}

// Squares strictly between `from` and `to` are empty. Only meaningful for lines.
bool pathIsClear(const Board& board, const Square& from, const Square& to) {
    const int df = (to.file > from.file) ? 1 : (to.file < from.file ? -1 : 0);
    const int dr = (to.rank > from.rank) ? 1 : (to.rank < from.rank ? -1 : 0);

    Square cur{from.file + df, from.rank + dr};
    while (cur != to && cur.isValid()) {
        if (board.pieceAt(cur)) return false;
        cur.file += df;
        cur.rank += dr;
    }
    return true;
}

int distance(const Square& a, const Square& b) {
    return std::abs(a.file - b.file) + std::abs(a.rank - b.rank);
}

ResolveResult applyCastle(Board& board, Side side, CastleSide castle) {
    const int homeRank = (side == Side::White) ? 0 : 7;
    const bool kingSide = (castle == CastleSide::King);

    const Square kingFrom{4, homeRank};
    const Square kingTo{kingSide ? 6 : 2, homeRank};
    const Square rookFrom{kingSide ? 7 : 0, homeRank};
    const Square rookTo{kingSide ? 5 : 3, homeRank};

    ResolveResult res;
    res.from = kingFrom;
    res.to = kingTo;

    const auto king = board.pieceAt(kingFrom);
    if (!king || *king != Piece{side, PieceKind::King}) {
        res.status = ResolveStatus::Unresolved;
        res.error = "No " + to_string(side) + " king on " + kingFrom.toString();
        return res;
    }

    const auto rook = board.pieceAt(rookFrom);
    board.setPiece(kingFrom, std::nullopt);
    board.setPiece(kingTo, king);
    // The rook only follows if it is actually on its home square.
    if (rook && *rook == Piece{side, PieceKind::Rook}) {
        board.setPiece(rookFrom, std::nullopt);
        board.setPiece(rookTo, rook);
    }

    res.status = ResolveStatus::Applied;
    return res;
}

} // namespace

std::string stripAnnotations(std::string token) {
    while (!token.empty()) {
        const char c = token.back();
        if (c == '+' || c == '#' || c == '!' || c == '?') {
            token.pop_back();
        } else {
            break;
        }
    }
    return token;
}

std::optional<SanMove> parseSanToken(const std::string& token) {
    if (token.empty()) return std::nullopt;

    // Castling
    if (token == "O-O" || token == "0-0" || token == "o-o") {
        SanMove m;
        m.kind = PieceKind::King;
        m.castle = CastleSide::King;
        return m;
    }
    if (token == "O-O-O" || token == "0-0-0" || token == "o-o-o") {
        SanMove m;
        m.kind = PieceKind::King;
        m.castle = CastleSide::Queen;
        return m;
    }

    SanMove move;
    size_t i = 0;

    // Piece letter or pawn
    if (auto kind = pieceKindFromLetter(token[0])) {
        move.kind = *kind;
        i = 1;
    }

    // Promotion ("=Q")
    std::string_view core = token;
    const size_t promoPos = token.find('=');
    if (promoPos != std::string::npos) {
        if (move.kind != PieceKind::Pawn) return std::nullopt;
        if (promoPos + 2 != token.size()) return std::nullopt;
        const auto promo = pieceKindFromLetter(token[promoPos + 1]);
        if (!promo || *promo == PieceKind::King) return std::nullopt;
        move.promotion = promo;
        core = std::string_view(token.data(), promoPos);
    }

    // Destination square = last 2 chars of core
    if (core.size() < i + 2) return std::nullopt;
    const auto to = board::parseSquare(core.substr(core.size() - 2));
    if (!to) return std::nullopt;
    move.to = *to;

    // Everything between the piece letter and the destination.
    std::string mods;
    for (char ch : core.substr(i, core.size() - 2 - i)) {
        if (ch == 'x' || ch == ':') {
            move.capture = true;
            continue;
        }
        mods.push_back(ch);
    }

    if (move.kind == PieceKind::Pawn) {
        if (mods.empty()) {
            // A push stays on its file.
            if (move.capture) return std::nullopt;
            move.disFile = move.to.file;
        } else if (mods.size() == 1 && isFileChar(mods[0])) {
            move.disFile = mods[0] - 'a';
        } else {
            return std::nullopt;
        }
        return move;
    }

    // Piece moves: disambiguation may be 0..2 chars (file/rank)
    if (mods.size() == 1) {
        const char d = mods[0];
        if (isFileChar(d)) move.disFile = d - 'a';
        else if (isRankChar(d)) move.disRank = d - '1';
        else return std::nullopt;
    } else if (mods.size() == 2) {
        if (!isFileChar(mods[0]) || !isRankChar(mods[1])) return std::nullopt;
        move.disFile = mods[0] - 'a';
        move.disRank = mods[1] - '1';
    } else if (mods.size() > 2) {
        return std::nullopt;
    }

    return move;
}

bool isPlausibleMove(PieceKind kind, Side side, const Square& from, const Square& to) {
    if (!from.isValid() || !to.isValid() || from == to) return false;

    const int df = to.file - from.file;
    const int dr = to.rank - from.rank;
    const int adf = std::abs(df);
    const int adr = std::abs(dr);

    switch (kind) {
        case PieceKind::King:
            return adf <= 1 && adr <= 1;
        case PieceKind::Queen:
            return df == 0 || dr == 0 || adf == adr;
        case PieceKind::Rook:
            return df == 0 || dr == 0;
        case PieceKind::Bishop:
            return adf == adr;
        case PieceKind::Knight:
            return (adf == 1 && adr == 2) || (adf == 2 && adr == 1);
        case PieceKind::Pawn: {
            const int forward = (side == Side::White) ? dr : -dr;
            if (forward <= 0) return false;
            if (df == 0) return forward <= 2;
            return adf == 1 && forward == 1;
        }
    }
    return false;
}

std::optional<Square> findSourceSquare(const Board& board, Side side, const SanMove& move) {
    if (move.castle != CastleSide::None) return std::nullopt;

    const Piece want{side, move.kind};

    std::vector<Square> candidates;
    for (const auto& sq : board.occupiedSquares()) {
        if (sq == move.to) continue;
        if (board.pieceAt(sq) != want) continue;
        if (move.disFile && sq.file != *move.disFile) continue;
        if (move.disRank && sq.rank != *move.disRank) continue;
        if (!isPlausibleMove(move.kind, side, sq, move.to)) continue;
        candidates.push_back(sq);
    }

    if (candidates.empty()) return std::nullopt;
    if (candidates.size() == 1) return candidates.front();

    if (isSlider(move.kind)) {
        std::vector<Square> clear;
        for (const auto& sq : candidates) {
            if (pathIsClear(board, sq, move.to)) clear.push_back(sq);
        }
        if (!clear.empty()) candidates.swap(clear);
    }

    // Closest wins; strict '<' keeps scan order on ties.
    Square best = candidates.front();
    for (const auto& sq : candidates) {
        if (distance(sq, move.to) < distance(best, move.to)) best = sq;
    }
    return best;
}

ResolveResult applySanMove(Board& board, Side side, const std::string& token) {
    ResolveResult res;

    const std::string san = stripAnnotations(token);
    const auto move = parseSanToken(san);
    if (!move) {
        res.status = ResolveStatus::Malformed;
        res.error = "Cannot parse SAN token: '" + token + "'";
        return res;
    }

    if (move->castle != CastleSide::None) {
        return applyCastle(board, side, move->castle);
    }

    res.to = move->to;

    const auto from = findSourceSquare(board, side, *move);
    if (!from) {
        res.status = ResolveStatus::Unresolved;
        res.error = "No " + to_string(side) + " " + to_string(move->kind) +
                    " can reach " + move->to.toString() + ": '" + token + "'";
        return res;
    }

    Piece moving = *board.pieceAt(*from);
    if (move->promotion) moving.kind = *move->promotion;

    // Capture marker or not, the destination occupant is replaced.
    board.setPiece(*from, std::nullopt);
    board.setPiece(move->to, moving);

    res.status = ResolveStatus::Applied;
    res.from = *from;
    return res;
}

} // namespace pgnreplay::domain::chess
