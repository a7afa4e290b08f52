#include "ui/BoardWidget.hpp"

#include <QPainter>
#include <QPaintEvent>
#include <QFont>

namespace pgnreplay::ui {

using pgnreplay::domain::Piece;
using pgnreplay::domain::PieceKind;
using pgnreplay::domain::Side;
using pgnreplay::domain::board::Board;
using pgnreplay::domain::board::Square;

static QChar unicodePiece(const Piece& piece) {
    // Unicode chess symbols: white U+2654..2659, black U+265A..265F
    ushort base = 0x2654;
    switch (piece.kind) {
        case PieceKind::King:   base = 0x2654; break;
        case PieceKind::Queen:  base = 0x2655; break;
        case PieceKind::Rook:   base = 0x2656; break;
        case PieceKind::Bishop: base = 0x2657; break;
        case PieceKind::Knight: base = 0x2658; break;
        case PieceKind::Pawn:   base = 0x2659; break;
    }
    return QChar(piece.side == Side::White ? base : static_cast<ushort>(base + 6));
}

BoardWidget::BoardWidget(QWidget* parent)
    : QWidget(parent)
    , board_(Board::startingPosition()) {
    setMinimumSize(320, 320);
}

void BoardWidget::setBoard(const Board& board) {
    board_ = board;
    update();
}

void BoardWidget::setHighlights(const QVector<Square>& squares) {
    highlights_ = squares;
    update();
}

void BoardWidget::setFlipped(bool flipped) {
    if (flipped_ == flipped) return;
    flipped_ = flipped;
    update();
}

QRectF BoardWidget::boardRect() const {
    const qreal m = 18.0;
    const qreal s = qMin(width(), height()) - 2*m;
    return QRectF((width() - s)/2.0, (height() - s)/2.0, s, s);
}

QRectF BoardWidget::squareRect(int file, int rank) const {
    // y=0 is top. Unflipped: White at bottom => rank 7 on top.
    const QRectF br = boardRect();
    const qreal sq = br.width() / 8.0;

    const int xIndex = flipped_ ? 7 - file : file;
    const int yIndex = flipped_ ? rank : 7 - rank;
    return QRectF(br.left() + xIndex*sq, br.top() + yIndex*sq, sq, sq);
}

void BoardWidget::paintEvent(QPaintEvent* ev) {
    Q_UNUSED(ev);
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setRenderHint(QPainter::TextAntialiasing, true);

    drawBoard(p);
    drawHighlights(p);
    drawPieces(p);
    drawCoordinates(p);

    // border
    p.setPen(QPen(QColor(0,0,0,60), 1.0));
    p.setBrush(Qt::NoBrush);
    p.drawRect(boardRect());
}

void BoardWidget::drawBoard(QPainter& p) {
    const QColor light(240, 217, 181);
    const QColor dark (181, 136,  99);

    for (int rank = 0; rank < 8; ++rank) {
        for (int file = 0; file < 8; ++file) {
            const bool isLight = ((file + rank) % 2 != 0);
            p.fillRect(squareRect(file, rank), isLight ? light : dark);
        }
    }
}

void BoardWidget::drawCoordinates(QPainter& p) {
    p.save();

    const QRectF br = boardRect();
    const qreal sq = br.width()/8.0;

    QFont font = p.font();
    font.setPixelSize(qMax(9, static_cast<int>(sq * 0.16)));
    p.setFont(font);
    p.setPen(QColor(60, 60, 60));

    for (int i = 0; i < 8; ++i) {
        const QRectF fileCell = squareRect(i, flipped_ ? 7 : 0);
        p.drawText(QRectF(fileCell.left(), br.bottom(), sq, 16.0),
                   Qt::AlignCenter, QString(QChar('a' + i)));

        const QRectF rankCell = squareRect(flipped_ ? 7 : 0, i);
        p.drawText(QRectF(br.left() - 16.0, rankCell.top(), 16.0, sq),
                   Qt::AlignCenter, QString::number(i + 1));
    }

    p.restore();
}

void BoardWidget::drawHighlights(QPainter& p) {
    if (highlights_.isEmpty()) return;
    p.save();
    p.setPen(Qt::NoPen);
    p.setBrush(QColor(255, 255, 0, 70));
    for (const auto& sq : highlights_) {
        if (!sq.isValid()) continue;
        p.drawRect(squareRect(sq.file, sq.rank));
    }
    p.restore();
}

void BoardWidget::drawPieces(QPainter& p) {
    p.save();

    const QRectF br = boardRect();
    const qreal sq = br.width()/8.0;

    QFont font("Segoe UI Symbol");
    font.setPixelSize(static_cast<int>(sq * 0.78));
    p.setFont(font);

    for (const auto& square : board_.occupiedSquares()) {
        const auto piece = board_.pieceAt(square);
        if (!piece) continue;

        // simple piece tint
        p.setPen(piece->side == Side::White ? QColor(250, 250, 250) : QColor(30, 30, 30));
        p.drawText(squareRect(square.file, square.rank), Qt::AlignCenter, QString(unicodePiece(*piece)));
    }

    p.restore();
}

} // namespace pgnreplay::ui
