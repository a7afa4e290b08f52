#pragma once

#include <string>

#include "app/IViewerConfigRepository.hpp"

namespace pgnreplay::infra {

class ViewerConfigRepository : public pgnreplay::app::IViewerConfigRepository {
public:
    explicit ViewerConfigRepository(std::string path);

    // Load viewer settings from JSON file.
    // If file is missing or invalid, returns defaults and logs a warning.
    // Missing or mistyped keys fall back to their default one by one.
    pgnreplay::app::ViewerConfig load() const override;

    void save(const pgnreplay::app::ViewerConfig& config) const override;

private:
    std::string path_;
};

} // namespace pgnreplay::infra
