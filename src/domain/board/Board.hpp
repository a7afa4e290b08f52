#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/domain_model.hpp"

namespace pgnreplay::domain::board {

struct Square {
    int file = 0; // 0=a..7=h
    int rank = 0; // 0=1..7=8

    std::string toString() const;
    bool isValid() const { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }
};

inline bool operator==(const Square& a, const Square& b) {
    return a.file == b.file && a.rank == b.rank;
}

inline bool operator!=(const Square& a, const Square& b) {
    return !(a == b);
}

std::optional<Square> parseSquare(std::string_view s); // "e2"

// Sparse square -> piece mapping. Absent entry means an empty square.
class Board {
public:
    Board() = default;

    static Board startingPosition();

    std::optional<Piece> pieceAt(const Square& sq) const;
    std::optional<Piece> pieceAt(std::string_view sq) const;

    void setPiece(const Square& sq, std::optional<Piece> piece);
    void clear();

    // Occupied squares in file-major, ascending-rank order (a1, a2, ..., h8).
    std::vector<Square> occupiedSquares() const;
    int pieceCount() const;

    // Piece placement field of FEN ("rnbqkbnr/pppppppp/8/...").
    std::string toFenPlacement() const;

    bool operator==(const Board& other) const { return squares_ == other.squares_; }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    static int indexOf(const Square& sq) { return (sq.rank << 3) | sq.file; }

    std::array<std::optional<Piece>, 64> squares_{};
};

} // namespace pgnreplay::domain::board
