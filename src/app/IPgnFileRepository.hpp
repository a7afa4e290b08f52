#pragma once

#include <string>

#include "domain/domain_model.hpp"

namespace pgnreplay::app {

struct PgnReadResult {
    bool ok{false};
    pgnreplay::domain::ErrorKind kind{pgnreplay::domain::ErrorKind::None};
    std::string error;
    std::string content; // UTF-8
};

// Port/interface for reading and writing PGN files.
// Implementations live in infra (e.g. QFile).
class IPgnFileRepository {
public:
    virtual ~IPgnFileRepository() = default;

    virtual PgnReadResult read(const std::string& path) const = 0;
    virtual pgnreplay::domain::OperationResult write(const std::string& path,
                                                     const std::string& content) const = 0;
};

} // namespace pgnreplay::app
