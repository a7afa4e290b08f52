#include "ui/GamesModel.hpp"

#include <QVariant>

#include "ui/UiFormatters.hpp"

namespace pgnreplay::ui {

GamesModel::GamesModel(QObject* parent)
    : QAbstractTableModel(parent) {
}

void GamesModel::setGames(std::vector<pgnreplay::domain::Game> games) {
    beginResetModel();
    games_ = std::move(games);
    endResetModel();
}

const pgnreplay::domain::Game* GamesModel::gameAt(int row) const {
    if (row < 0 || row >= static_cast<int>(games_.size())) return nullptr;
    return &games_[static_cast<size_t>(row)];
}

int GamesModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return static_cast<int>(games_.size());
}

int GamesModel::columnCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return ColumnCount;
}

QVariant GamesModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()) return {};
    const int row = index.row();
    const int col = index.column();
    const auto* g = gameAt(row);
    if (!g) return {};
    const auto& m = g->metadata;

    if (role == Qt::DisplayRole) {
        switch (col) {
            case Number: return row + 1;
            case White:  return fmt::optionalText(m.white);
            case Black:  return fmt::optionalText(m.black);
            case Event:  return fmt::optionalText(m.event);
            case Date:   return fmt::optionalText(m.date);
            case Result: return fmt::optionalText(m.result);
            case Moves:  return static_cast<int>(g->moves.size());
            default:     return {};
        }
    }

    if (role == Qt::ToolTipRole) {
        return QString::fromStdString(g->title());
    }

    if (role == Qt::TextAlignmentRole) {
        if (col == Number || col == Result || col == Moves) return Qt::AlignCenter;
    }

    return {};
}

QVariant GamesModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation != Qt::Horizontal) return {};
    if (role != Qt::DisplayRole) return {};

    switch (section) {
        case Number: return QStringLiteral("#");
        case White: return QStringLiteral("White");
        case Black: return QStringLiteral("Black");
        case Event: return QStringLiteral("Event");
        case Date: return QStringLiteral("Date");
        case Result: return QStringLiteral("Result");
        case Moves: return QStringLiteral("Moves");
        default: return {};
    }
}

} // namespace pgnreplay::ui
