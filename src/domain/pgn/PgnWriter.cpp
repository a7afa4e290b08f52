#include "domain/pgn/PgnWriter.hpp"

#include <cmath>

#include "domain/pgn/PgnParser.hpp"
#include "domain/pgn/PgnTags.hpp"
#include "domain/pgn/PgnText.hpp"

namespace pgnreplay::domain::pgn {

namespace {

void appendRecord(std::string& out, const std::string& text) {
    if (!out.empty()) out.push_back(' ');
    out += text;
}

std::string withTags(const GameMetadata& metadata, const std::string& movetext) {
    std::string out = serializeTags(metadata);
    if (!out.empty()) out.push_back('\n');
    out += movetext;
    return out;
}

} // namespace

std::string serializeTags(const GameMetadata& metadata) {
    std::string out;
    for (PgnTag tag : kRecognizedTags) {
        const auto& value = tagField(metadata, tag);
        if (!value) continue;
        out += "[";
        out += tagName(tag);
        out += " \"";
        out += escapePgnString(*value);
        out += "\"]\n";
    }
    return out;
}

std::string serializeGame(const GameMetadata& metadata, const std::vector<MoveRecord>& moves) {
    std::string movetext;
    for (const auto& rec : moves) {
        appendRecord(movetext, rec.text);
    }
    appendRecord(movetext, metadata.result.value_or("*"));
    movetext.push_back('\n');

    return withTags(metadata, movetext);
}

std::string movesUpTo(const GameMetadata& metadata,
                      const std::vector<MoveRecord>& moves,
                      double cursor) {
    const long halves = std::lround(cursor * 2.0);

    std::string movetext;
    if (halves > 0) {
        const size_t whole = static_cast<size_t>(halves / 2);
        for (size_t i = 0; i < whole && i < moves.size(); ++i) {
            appendRecord(movetext, moves[i].text);
        }
        if ((halves % 2) != 0 && whole < moves.size()) {
            const auto& rec = moves[whole];
            appendRecord(movetext, renderMoveText(rec.number, rec.white, std::nullopt));
        }
    }

    return withTags(metadata, movetext);
}

} // namespace pgnreplay::domain::pgn
