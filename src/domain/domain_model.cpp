#include "domain/domain_model.hpp"

#include <atomic>
#include <chrono>

namespace pgnreplay::domain {

namespace {

std::string firstNamePart(const std::optional<std::string>& name, const char* fallback) {
    if (!name) return fallback;
    const auto comma = name->find(',');
    return (comma == std::string::npos) ? *name : name->substr(0, comma);
}

} // namespace

std::string Game::title() const {
    const std::string white = metadata.white.value_or("Unknown");
    const std::string black = metadata.black.value_or("Unknown");
    const std::string event = metadata.event.value_or("Chess Game");
    const std::string date  = metadata.date.value_or("");

    return white + " vs " + black + " - " + event + " " + date;
}

std::string Game::summary() const {
    const std::string result = metadata.result.value_or("*");
    return firstNamePart(metadata.white, "White") + " vs " +
           firstNamePart(metadata.black, "Black") + " (" + result + ")";
}

GameId makeGameId() {
    using namespace std::chrono;
    static std::atomic<unsigned long long> seq{0};

    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return "game-" + std::to_string(ms) + "-" + std::to_string(++seq);
}

} // namespace pgnreplay::domain
