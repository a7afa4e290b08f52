#include "domain/pgn/PgnParser.hpp"

#include <cctype>
#include <optional>

#include "domain/pgn/PgnSplitter.hpp"
#include "domain/pgn/PgnTags.hpp"
#include "domain/pgn/PgnText.hpp"

namespace pgnreplay::domain::pgn {

namespace {

// Very small tag parser. Returns true on success.
static bool parseTagLine(const std::string& line, std::string& outKey, std::string& outVal) {
    // Expected: [Key "Value"]
    if (line.size() < 4) return false;
    if (line.front() != '[') return false;
    if (line.back() != ']') return false;

    std::string_view mid(line.data() + 1, line.size() - 2);
    // Find first whitespace separating key and value.
    size_t sp = 0;
    while (sp < mid.size() && !std::isspace(static_cast<unsigned char>(mid[sp]))) ++sp;
    if (sp == 0 || sp >= mid.size()) return false;

    outKey = std::string(mid.substr(0, sp));

    // Only whitespace may sit between the key and the opening quote.
    size_t q1 = sp;
    while (q1 < mid.size() && std::isspace(static_cast<unsigned char>(mid[q1]))) ++q1;
    if (q1 >= mid.size() || mid[q1] != '"') return false;

    // Find closing quote (scan, respecting escapes).
    size_t q2 = q1 + 1;
    bool escaped = false;
    for (; q2 < mid.size(); ++q2) {
        const char c = mid[q2];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') break;
    }
    if (q2 >= mid.size()) return false;

    const std::string_view rawVal = mid.substr(q1 + 1, q2 - (q1 + 1));
    outVal = unescapePgnString(rawVal);
    return true;
}

// Leading tag name of a broken tag line, e.g. "[White Kasparov]" -> "White".
static std::string_view tagNameOfBrokenLine(const std::string& line) {
    std::string_view v(line);
    v.remove_prefix(1);
    size_t e = 0;
    while (e < v.size() && std::isalnum(static_cast<unsigned char>(v[e]))) ++e;
    return v.substr(0, e);
}

// Move-number prefix of a token: "12." / "12..." / "12.Nf3".
struct NumberPrefix {
    int number{0};
    int dots{0};
    std::string rest;
};

static std::optional<NumberPrefix> splitNumberPrefix(const std::string& token) {
    size_t i = 0;
    while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) ++i;
    if (i == 0 || i >= token.size() || token[i] != '.') return std::nullopt;
    if (i > 6) return std::nullopt;

    NumberPrefix p;
    p.number = std::stoi(token.substr(0, i));
    while (i < token.size() && token[i] == '.') {
        ++p.dots;
        ++i;
    }
    p.rest = token.substr(i);
    return p;
}

static bool isAllDigits(const std::string& t) {
    if (t.empty()) return false;
    for (unsigned char c : t) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

class MoveListBuilder {
public:
    void marker(int number) {
        flush();
        number_ = number;
    }

    // "12..." continues Black's half of an already numbered move.
    void continuation(int number) {
        if (!pendingWhite_) number_ = number;
    }

    void move(std::string token) {
        if (!pendingWhite_) {
            pendingWhite_ = std::move(token);
            return;
        }
        emit(std::move(token));
        ++number_;
    }

    std::vector<MoveRecord> finish() {
        flush();
        return std::move(moves_);
    }

private:
    void flush() {
        if (pendingWhite_) emit(std::nullopt);
    }

    void emit(std::optional<std::string> black) {
        MoveRecord r;
        r.number = number_;
        r.white = std::move(pendingWhite_);
        r.black = std::move(black);
        r.text = renderMoveText(r.number, r.white, r.black);
        moves_.push_back(std::move(r));
        pendingWhite_.reset();
    }

    int number_{1};
    std::optional<std::string> pendingWhite_;
    std::vector<MoveRecord> moves_;
};

} // namespace

std::string renderMoveText(int number,
                           const std::optional<std::string>& white,
                           const std::optional<std::string>& black) {
    std::string text = std::to_string(number) + ".";
    if (white) text += " " + *white;
    if (black) text += " " + *black;
    return text;
}

std::vector<MoveRecord> parseMovetext(std::string_view movetext) {
    const std::string cleaned = removeCommentsAndVariations(movetext);

    MoveListBuilder builder;
    for (const auto& token : splitWhitespace(cleaned)) {
        if (isResultToken(token)) continue;
        if (token.front() == '$') continue; // NAG
        if (isAllDigits(token)) continue;

        if (auto prefix = splitNumberPrefix(token)) {
            if (prefix->dots == 1) {
                builder.marker(prefix->number);
            } else {
                builder.continuation(prefix->number);
            }
            if (!prefix->rest.empty() && !isResultToken(prefix->rest)) {
                builder.move(prefix->rest);
            }
            continue;
        }

        builder.move(token);
    }
    return builder.finish();
}

PgnGameParse parsePgnGame(std::string_view gameText) {
    PgnGameParse res;
    std::string movetext;
    movetext.reserve(gameText.size());

    for (const auto& rawLine : splitLines(gameText)) {
        const std::string line = trim(rawLine);
        if (line.empty()) continue;
        if (line.front() == '%') continue;

        if (line.front() == '[') {
            std::string key, value;
            if (parseTagLine(line, key, value)) {
                if (auto tag = tagFromName(key)) {
                    tagField(res.metadata, *tag) = std::move(value);
                }
                continue;
            }
            if (tagFromName(tagNameOfBrokenLine(line))) {
                res.skippedTagLines.push_back(line);
            }
            continue;
        }

        movetext += line;
        movetext.push_back('\n');
    }

    res.moves = parseMovetext(movetext);
    return res;
}

std::vector<Game> parsePgnText(const std::string& rawText) {
    const std::string text = normalizePgnText(rawText);
    const auto split = splitPgnGames(text);

    std::vector<Game> games;
    games.reserve(split.spans.size());
    for (const auto& span : split.spans) {
        auto parsed = parsePgnGame(span.text);

        Game g;
        g.id = makeGameId();
        g.metadata = std::move(parsed.metadata);
        g.moves = std::move(parsed.moves);
        g.rawText = span.text;
        g.skippedTagLines = std::move(parsed.skippedTagLines);
        games.push_back(std::move(g));
    }
    return games;
}

} // namespace pgnreplay::domain::pgn
