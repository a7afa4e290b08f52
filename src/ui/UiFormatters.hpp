#pragma once

#include <QString>

#include <optional>
#include <string>

#include "domain/chess/GameState.hpp"
#include "domain/domain_model.hpp"

namespace pgnreplay::ui::fmt {

QString optionalText(const std::optional<std::string>& value);

// "1.5" style cursor, "0" at the start.
QString formatCursor(double cursor);

// "Move 2 (White)" for the half-move that led to `cursor`, "Start" at 0.
QString formatPositionLabel(const pgnreplay::domain::chess::PositionSnapshot& pos);

QString formatError(pgnreplay::domain::ErrorKind kind, const std::string& error);

} // namespace pgnreplay::ui::fmt
