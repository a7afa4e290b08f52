#pragma once

#include <string>

#include "app/IPgnFileRepository.hpp"

namespace pgnreplay::infra {

class PgnFileRepository : public pgnreplay::app::IPgnFileRepository {
public:
    PgnFileRepository() = default;

    // Reads the whole file as UTF-8. A missing or unreadable file, or bytes
    // that are not valid UTF-8, give an UnreadableSource result.
    pgnreplay::app::PgnReadResult read(const std::string& path) const override;

    // Writes UTF-8 text without a byte-order mark, replacing the file.
    pgnreplay::domain::OperationResult write(const std::string& path,
                                             const std::string& content) const override;
};

} // namespace pgnreplay::infra
