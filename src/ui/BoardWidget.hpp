#pragma once

#include <QWidget>
#include <QRectF>
#include <QVector>

#include "domain/board/Board.hpp"

class QPainter;

namespace pgnreplay::ui {

class BoardWidget : public QWidget {
    Q_OBJECT
public:
    explicit BoardWidget(QWidget* parent = nullptr);

    void setBoard(const pgnreplay::domain::board::Board& board);
    void setHighlights(const QVector<pgnreplay::domain::board::Square>& squares);

    // Black at the bottom when flipped.
    void setFlipped(bool flipped);
    bool isFlipped() const { return flipped_; }

protected:
    void paintEvent(QPaintEvent* ev) override;

private:
    QRectF boardRect() const;
    QRectF squareRect(int file, int rank) const; // rank: 0..7 (1..8)

    void drawBoard(QPainter& p);
    void drawCoordinates(QPainter& p);
    void drawHighlights(QPainter& p);
    void drawPieces(QPainter& p);

    pgnreplay::domain::board::Board board_;
    QVector<pgnreplay::domain::board::Square> highlights_;
    bool flipped_{false};
};

} // namespace pgnreplay::ui
