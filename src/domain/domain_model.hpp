#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pgnreplay::domain {

using GameId = std::string;

// --- Pieces -----------------------------------------------------------------

enum class Side {
    White = 0,
    Black = 1
};

enum class PieceKind {
    King   = 0,
    Queen  = 1,
    Rook   = 2,
    Bishop = 3,
    Knight = 4,
    Pawn   = 5
};

struct Piece {
    Side      side{Side::White};
    PieceKind kind{PieceKind::Pawn};
};

inline bool operator==(const Piece& a, const Piece& b) {
    return a.side == b.side && a.kind == b.kind;
}

inline bool operator!=(const Piece& a, const Piece& b) {
    return !(a == b);
}

inline Side opposite(Side s) {
    return (s == Side::White) ? Side::Black : Side::White;
}

// --- Moves ------------------------------------------------------------------

// One move-number unit of the game history. Created once by the parser.
struct MoveRecord {
    int                        number{1};
    std::optional<std::string> white;   // absent only for an unplayed slot
    std::optional<std::string> black;   // absent when the game stops on White's move
    std::string                text;    // "12. Nf3 Nc6"
    std::optional<std::string> comment; // reserved, always empty for now
};

inline bool operator==(const MoveRecord& a, const MoveRecord& b) {
    return a.number == b.number && a.white == b.white && a.black == b.black &&
           a.text == b.text && a.comment == b.comment;
}

// --- Game -------------------------------------------------------------------

struct GameMetadata {
    std::optional<std::string> event;
    std::optional<std::string> site;
    std::optional<std::string> date;
    std::optional<std::string> round;
    std::optional<std::string> white;
    std::optional<std::string> black;
    std::optional<std::string> result; // "1-0", "0-1", "1/2-1/2" or "*"

    bool empty() const {
        return !event && !site && !date && !round && !white && !black && !result;
    }
};

inline bool operator==(const GameMetadata& a, const GameMetadata& b) {
    return a.event == b.event && a.site == b.site && a.date == b.date &&
           a.round == b.round && a.white == b.white && a.black == b.black &&
           a.result == b.result;
}

inline bool operator!=(const GameMetadata& a, const GameMetadata& b) {
    return !(a == b);
}

struct Player {
    std::string id;
    std::string name;
    Side        side{Side::White};
};

// Immutable once produced by the parser. Identity is the generated id only.
struct Game {
    GameId                  id;
    GameMetadata            metadata;
    std::vector<MoveRecord> moves;
    std::string             rawText;

    // Raw tag lines that looked like tags but could not be parsed.
    std::vector<std::string> skippedTagLines;

    std::string title() const;
    std::string summary() const;
};

inline bool operator==(const Game& a, const Game& b) {
    return a.id == b.id;
}

inline bool operator!=(const Game& a, const Game& b) {
    return !(a == b);
}

// Generates "game-<ms>-<seq>". Unique within the process.
GameId makeGameId();

// --- Errors -----------------------------------------------------------------

enum class ErrorKind {
    None             = 0,
    UnreadableSource = 1,
    MalformedTag     = 2,
    UnresolvedMove   = 3,
    NotImplemented   = 4
};

struct OperationResult {
    bool        ok{false};
    ErrorKind   kind{ErrorKind::None};
    std::string error;
};

// --- Helpers ----------------------------------------------------------------

inline bool isResultToken(const std::string& t) {
    return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
}

inline std::string to_string(Side s) {
    switch (s) {
        case Side::White: return "White";
        case Side::Black: return "Black";
    }
    return "Unknown";
}

inline std::string to_string(PieceKind k) {
    switch (k) {
        case PieceKind::King:   return "King";
        case PieceKind::Queen:  return "Queen";
        case PieceKind::Rook:   return "Rook";
        case PieceKind::Bishop: return "Bishop";
        case PieceKind::Knight: return "Knight";
        case PieceKind::Pawn:   return "Pawn";
    }
    return "Unknown";
}

inline std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:             return "None";
        case ErrorKind::UnreadableSource: return "UnreadableSource";
        case ErrorKind::MalformedTag:     return "MalformedTag";
        case ErrorKind::UnresolvedMove:   return "UnresolvedMove";
        case ErrorKind::NotImplemented:   return "NotImplemented";
    }
    return "Unknown";
}

// FEN letter: uppercase for White, lowercase for Black.
inline char toFenChar(const Piece& p) {
    char c = 'P';
    switch (p.kind) {
        case PieceKind::King:   c = 'K'; break;
        case PieceKind::Queen:  c = 'Q'; break;
        case PieceKind::Rook:   c = 'R'; break;
        case PieceKind::Bishop: c = 'B'; break;
        case PieceKind::Knight: c = 'N'; break;
        case PieceKind::Pawn:   c = 'P'; break;
    }
    return (p.side == Side::White) ? c : static_cast<char>(c - 'A' + 'a');
}

inline std::optional<PieceKind> pieceKindFromLetter(char c) {
    switch (c) {
        case 'K': return PieceKind::King;
        case 'Q': return PieceKind::Queen;
        case 'R': return PieceKind::Rook;
        case 'B': return PieceKind::Bishop;
        case 'N': return PieceKind::Knight;
        default:  return std::nullopt;
    }
}

} // namespace pgnreplay::domain
