#pragma once

#include <optional>
#include <string>

#include "domain/board/Board.hpp"
#include "domain/domain_model.hpp"

namespace pgnreplay::domain::chess {

enum class CastleSide {
    None,
    King,
    Queen
};

// Parsed SAN token. No legality information.
struct SanMove {
    PieceKind                kind{PieceKind::Pawn};
    CastleSide               castle{CastleSide::None};
    board::Square            to;
    bool                     capture{false};
    std::optional<int>       disFile; // 0..7
    std::optional<int>       disRank; // 0..7
    std::optional<PieceKind> promotion;
};

enum class ResolveStatus {
    Applied,
    Unresolved, // parsed, but no piece can make the move; board untouched
    Malformed   // token is not SAN; board untouched
};

struct ResolveResult {
    ResolveStatus status{ResolveStatus::Malformed};
    board::Square from;
    board::Square to;
    std::string   error;

    bool ok() const { return status == ResolveStatus::Applied; }
};

// Drops trailing check/mate and annotation glyphs ("Nf3+!?" -> "Nf3").
std::string stripAnnotations(std::string token);

// Parses a stripped SAN token: "e4", "Nbd7", "R1e2", "exd5", "e8=Q", "O-O-O".
std::optional<SanMove> parseSanToken(const std::string& token);

// Geometry only: does a piece of this kind move from `from` to `to` on an empty board?
// Pawns may go one or two squares forward, or one diagonally forward.
bool isPlausibleMove(PieceKind kind, Side side, const board::Square& from, const board::Square& to);

// Picks the source square for a non-castling move, or nullopt when no piece fits.
//
// Candidates are the side's pieces of the move's kind that fit the disambiguation
// hints and plausible geometry. With several left, sliders with a clear path win,
// then the one closest to the destination (file + rank distance), then scan order.
std::optional<board::Square> findSourceSquare(const board::Board& board, Side side, const SanMove& move);

// Resolves `token` for `side` and applies it to `board`. Nothing is validated
// beyond the candidate search; on failure the board is left unchanged.
ResolveResult applySanMove(board::Board& board, Side side, const std::string& token);

} // namespace pgnreplay::domain::chess
