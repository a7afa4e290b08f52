#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "domain/domain_model.hpp"

namespace pgnreplay::domain::pgn {

// The recognized tag set. Anything else in a tag section is dropped.
enum class PgnTag {
    Event = 0,
    Site,
    Date,
    Round,
    White,
    Black,
    Result
};

// Seven Tag Roster order, used when writing.
constexpr std::array<PgnTag, 7> kRecognizedTags = {
    PgnTag::Event, PgnTag::Site, PgnTag::Date, PgnTag::Round,
    PgnTag::White, PgnTag::Black, PgnTag::Result
};

inline const char* tagName(PgnTag t) {
    switch (t) {
        case PgnTag::Event:  return "Event";
        case PgnTag::Site:   return "Site";
        case PgnTag::Date:   return "Date";
        case PgnTag::Round:  return "Round";
        case PgnTag::White:  return "White";
        case PgnTag::Black:  return "Black";
        case PgnTag::Result: return "Result";
    }
    return "";
}

inline std::optional<PgnTag> tagFromName(std::string_view name) {
    for (PgnTag t : kRecognizedTags) {
        if (name == tagName(t)) return t;
    }
    return std::nullopt;
}

inline std::optional<std::string>& tagField(GameMetadata& m, PgnTag t) {
    switch (t) {
        case PgnTag::Event:  return m.event;
        case PgnTag::Site:   return m.site;
        case PgnTag::Date:   return m.date;
        case PgnTag::Round:  return m.round;
        case PgnTag::White:  return m.white;
        case PgnTag::Black:  return m.black;
        case PgnTag::Result: return m.result;
    }
    return m.event;
}

inline const std::optional<std::string>& tagField(const GameMetadata& m, PgnTag t) {
    return tagField(const_cast<GameMetadata&>(m), t);
}

} // namespace pgnreplay::domain::pgn
