#include "ui/UiFormatters.hpp"

#include <cmath>

namespace pgnreplay::ui::fmt {

QString optionalText(const std::optional<std::string>& value) {
    return value ? QString::fromStdString(*value) : QString();
}

QString formatCursor(double cursor) {
    return QString::number(cursor, 'f', 1);
}

QString formatPositionLabel(const pgnreplay::domain::chess::PositionSnapshot& pos) {
    if (pos.cursor <= 0.0) {
        return QStringLiteral("Start");
    }
    const int record = static_cast<int>(std::ceil(pos.cursor));
    const bool whiteMoved = (std::floor(pos.cursor) != pos.cursor);
    return QStringLiteral("Move %1 (%2)")
        .arg(record)
        .arg(whiteMoved ? QStringLiteral("White") : QStringLiteral("Black"));
}

QString formatError(pgnreplay::domain::ErrorKind kind, const std::string& error) {
    return QStringLiteral("%1: %2")
        .arg(QString::fromStdString(pgnreplay::domain::to_string(kind)),
             QString::fromStdString(error));
}

} // namespace pgnreplay::ui::fmt
