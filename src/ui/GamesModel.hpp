#pragma once

#include <QAbstractTableModel>

#include <vector>

#include "domain/domain_model.hpp"

namespace pgnreplay::ui {

class GamesModel final : public QAbstractTableModel {
    Q_OBJECT

public:
    enum Column {
        Number = 0,
        White,
        Black,
        Event,
        Date,
        Result,
        Moves,
        ColumnCount
    };

    explicit GamesModel(QObject* parent = nullptr);

    void setGames(std::vector<pgnreplay::domain::Game> games);
    const pgnreplay::domain::Game* gameAt(int row) const;

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;

private:
    std::vector<pgnreplay::domain::Game> games_;
};

} // namespace pgnreplay::ui
