#pragma once

#include <string>

namespace pgnreplay::app {

struct ViewerConfig {
    int         contextMoves{5};
    bool        flipBoard{false};
    bool        showHighlights{true};
    std::string lastFile;
};

// Port/interface for reading/writing viewer settings.
class IViewerConfigRepository {
public:
    virtual ~IViewerConfigRepository() = default;

    virtual ViewerConfig load() const = 0;
    virtual void save(const ViewerConfig& config) const = 0;
};

} // namespace pgnreplay::app
