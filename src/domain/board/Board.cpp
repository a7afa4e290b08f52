#include "domain/board/Board.hpp"

namespace pgnreplay::domain::board {

std::string Square::toString() const {
    if (!isValid()) return {};
    std::string s;
    s.push_back(static_cast<char>('a' + file));
    s.push_back(static_cast<char>('1' + rank));
    return s;
}

std::optional<Square> parseSquare(std::string_view s) {
    if (s.size() != 2) return std::nullopt;
    const char f = s[0];
    const char r = s[1];
    if (f < 'a' || f > 'h') return std::nullopt;
    if (r < '1' || r > '8') return std::nullopt;
    return Square{f - 'a', r - '1'};
}

Board Board::startingPosition() {
    static const PieceKind backRank[8] = {
        PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
        PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook
    };

    Board b;
    for (int f = 0; f < 8; ++f) {
        b.setPiece(Square{f, 0}, Piece{Side::White, backRank[f]});
        b.setPiece(Square{f, 1}, Piece{Side::White, PieceKind::Pawn});
        b.setPiece(Square{f, 6}, Piece{Side::Black, PieceKind::Pawn});
        b.setPiece(Square{f, 7}, Piece{Side::Black, backRank[f]});
    }
    return b;
}

std::optional<Piece> Board::pieceAt(const Square& sq) const {
    if (!sq.isValid()) return std::nullopt;
    return squares_[indexOf(sq)];
}

std::optional<Piece> Board::pieceAt(std::string_view sq) const {
    const auto parsed = parseSquare(sq);
    if (!parsed) return std::nullopt;
    return pieceAt(*parsed);
}

void Board::setPiece(const Square& sq, std::optional<Piece> piece) {
    if (!sq.isValid()) return;
    squares_[indexOf(sq)] = piece;
}

void Board::clear() {
    squares_.fill(std::nullopt);
}

std::vector<Square> Board::occupiedSquares() const {
    std::vector<Square> out;
    out.reserve(32);
    for (int f = 0; f < 8; ++f) {
        for (int r = 0; r < 8; ++r) {
            const Square sq{f, r};
            if (squares_[indexOf(sq)]) out.push_back(sq);
        }
    }
    return out;
}

int Board::pieceCount() const {
    int n = 0;
    for (const auto& p : squares_) {
        if (p) ++n;
    }
    return n;
}

std::string Board::toFenPlacement() const {
    std::string placement;
    placement.reserve(80);
    for (int r = 7; r >= 0; --r) {
        int emptyRun = 0;
        for (int f = 0; f < 8; ++f) {
            const auto& p = squares_[indexOf(Square{f, r})];
            if (!p) {
                ++emptyRun;
                continue;
            }
            if (emptyRun > 0) {
                placement.push_back(static_cast<char>('0' + emptyRun));
                emptyRun = 0;
            }
            placement.push_back(toFenChar(*p));
        }
        if (emptyRun > 0) {
            placement.push_back(static_cast<char>('0' + emptyRun));
        }
        if (r != 0) placement.push_back('/');
    }
    return placement;
}

} // namespace pgnreplay::domain::board
