#include <QtTest>

#include "domain/chess/ReplayEngine.hpp"
#include "domain/pgn/PgnParser.hpp"

using namespace pgnreplay::domain;
using namespace pgnreplay::domain::chess;
using pgnreplay::domain::board::Board;

namespace {

const char* kScenario =
    "[White \"A\"]\n[Black \"B\"]\n[Result \"*\"]\n\n1. e4 e5 2. Nf3 Nc6 *";

Game parseOne(const std::string& text) {
    auto games = pgn::parsePgnText(text);
    return games.empty() ? Game{} : games.front();
}

bool holds(const Board& b, const char* s, Side side, PieceKind kind) {
    const auto p = b.pieceAt(s);
    return p && *p == Piece{side, kind};
}

} // namespace

class TestReplayEngine : public QObject {
    Q_OBJECT

private slots:
    void initialState();
    void scenarioSteps();
    void boundaryIdempotence();
    void nextUntilEndMatchesLast_data();
    void nextUntilEndMatchesLast();
    void previousRestoresBoard_data();
    void previousRestoresBoard();
    void lastOnWhiteOnlyRecord();
    void hasNextAtHalfCursor();
    void whiteOnlyRecordMidGame();
    void jumpTo();
    void castlingHighlight();
    void unresolvedMovesAreReported();
    void loadGameReplacesState();
    void emptyGame();
};

void TestReplayEngine::initialState() {
    ReplayEngine engine;
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(!engine.hasPreviousMove());
    QVERIFY(!engine.hasNextMove());
    QVERIFY(engine.state().board == Board::startingPosition());
}

void TestReplayEngine::scenarioSteps() {
    const auto games = pgn::parsePgnText(kScenario);
    QCOMPARE(static_cast<int>(games.size()), 1);

    ReplayEngine engine;
    engine.loadGame(games.front());
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(engine.hasNextMove());
    QVERIFY(!engine.hasPreviousMove());

    engine.next();
    QCOMPARE(engine.cursor(), 0.5);
    QVERIFY(!engine.state().board.pieceAt("e2").has_value());
    QVERIFY(holds(engine.state().board, "e4", Side::White, PieceKind::Pawn));

    engine.next();
    QCOMPARE(engine.cursor(), 1.0);
    QVERIFY(!engine.state().board.pieceAt("e7").has_value());
    QVERIFY(holds(engine.state().board, "e5", Side::Black, PieceKind::Pawn));

    const auto pos = engine.currentPosition();
    QCOMPARE(pos.cursor, 1.0);
    QVERIFY(pos.hasPrevious);
    QVERIFY(pos.hasNext);
    QVERIFY(pos.board == engine.state().board);
    QVERIFY(pos.lastMove.has_value());
    QCOMPARE(QString::fromStdString(pos.lastMove->from.toString()), QStringLiteral("e7"));
    QCOMPARE(QString::fromStdString(pos.lastMove->to.toString()), QStringLiteral("e5"));
}

void TestReplayEngine::boundaryIdempotence() {
    ReplayEngine engine;
    engine.loadGame(parseOne(kScenario));

    engine.first();
    engine.previous();
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(engine.state().board == Board::startingPosition());
    QVERIFY(!engine.state().lastMove.has_value());

    engine.last();
    const double end = engine.cursor();
    const Board endBoard = engine.state().board;
    QCOMPARE(end, 2.0);

    engine.next();
    QCOMPARE(engine.cursor(), end);
    QVERIFY(engine.state().board == endBoard);
    QVERIFY(!engine.hasNextMove());

    engine.last();
    QCOMPARE(engine.cursor(), end);
    QVERIFY(engine.state().board == endBoard);

    engine.first();
    engine.first();
    QCOMPARE(engine.cursor(), 0.0);
}

void TestReplayEngine::nextUntilEndMatchesLast_data() {
    QTest::addColumn<QString>("movetext");
    QTest::addColumn<double>("endCursor");

    QTest::newRow("scenario") << "1. e4 e5 2. Nf3 Nc6 *" << 2.0;
    QTest::newRow("castling") << "1. e4 e5 2. Nf3 Nc6 3. Bc4 Bc5 4. O-O Nf6 5. d3 d6 6. c3 O-O *" << 6.0;
    QTest::newRow("ends on white") << "1. d4 d5 2. c4 dxc4 3. e3" << 2.5;
    QTest::newRow("with unresolved") << "1. e4 e5 2. Nd5 Nc6 *" << 2.0;
}

void TestReplayEngine::nextUntilEndMatchesLast() {
    QFETCH(QString, movetext);
    QFETCH(double, endCursor);

    const Game game = parseOne(movetext.toStdString());

    ReplayEngine stepper;
    stepper.loadGame(game);
    int guard = 0;
    while (stepper.hasNextMove() && guard++ < 1000) {
        stepper.next();
    }

    ReplayEngine jumper;
    jumper.loadGame(game);
    jumper.last();

    QCOMPARE(stepper.cursor(), endCursor);
    QCOMPARE(jumper.cursor(), endCursor);
    QVERIFY(stepper.state().board == jumper.state().board);
    QCOMPARE(QString::fromStdString(stepper.state().board.toFenPlacement()),
             QString::fromStdString(jumper.state().board.toFenPlacement()));
}

void TestReplayEngine::previousRestoresBoard_data() {
    nextUntilEndMatchesLast_data();
}

void TestReplayEngine::previousRestoresBoard() {
    QFETCH(QString, movetext);

    ReplayEngine engine;
    engine.loadGame(parseOne(movetext.toStdString()));

    while (engine.hasNextMove()) {
        const Board before = engine.state().board;
        const double cursorBefore = engine.cursor();

        engine.next();
        engine.previous();

        QVERIFY(engine.state().board == before);
        QCOMPARE(engine.cursor(), cursorBefore);

        engine.next();
    }
}

void TestReplayEngine::lastOnWhiteOnlyRecord() {
    ReplayEngine engine;
    engine.loadGame(parseOne("1. e4 e5 2. Nf3"));

    engine.last();
    QCOMPARE(engine.cursor(), 1.5);
    QVERIFY(!engine.hasNextMove());
    QVERIFY(holds(engine.state().board, "f3", Side::White, PieceKind::Knight));
}

void TestReplayEngine::hasNextAtHalfCursor() {
    ReplayEngine engine;
    engine.loadGame(parseOne(kScenario));

    engine.jumpTo(1.5);
    QCOMPARE(engine.cursor(), 1.5);
    QVERIFY(engine.hasNextMove()); // record 2 has Black's reply

    engine.next();
    QCOMPARE(engine.cursor(), 2.0);
    QVERIFY(!engine.hasNextMove());
    QVERIFY(holds(engine.state().board, "c6", Side::Black, PieceKind::Knight));
}

void TestReplayEngine::whiteOnlyRecordMidGame() {
    ReplayEngine engine;
    engine.loadGame(parseOne("1. e4 2. d4 d5"));

    QCOMPARE(static_cast<int>(engine.halfMoveCount()), 3);

    engine.next();
    QCOMPARE(engine.cursor(), 0.5);
    engine.next();
    QCOMPARE(engine.cursor(), 1.5);
    QVERIFY(holds(engine.state().board, "d4", Side::White, PieceKind::Pawn));
    engine.next();
    QCOMPARE(engine.cursor(), 2.0);
    QVERIFY(holds(engine.state().board, "d5", Side::Black, PieceKind::Pawn));
    QVERIFY(!engine.hasNextMove());

    engine.previous();
    QCOMPARE(engine.cursor(), 1.5);
}

void TestReplayEngine::jumpTo() {
    const Game game = parseOne(kScenario);

    ReplayEngine stepped;
    stepped.loadGame(game);
    stepped.next();
    stepped.next();
    stepped.next();

    ReplayEngine engine;
    engine.loadGame(game);

    engine.jumpTo(1.5);
    QCOMPARE(engine.cursor(), 1.5);
    QVERIFY(engine.state().board == stepped.state().board);

    engine.jumpTo(0.7);
    QCOMPARE(engine.cursor(), 0.5);

    engine.jumpTo(100.0);
    QCOMPARE(engine.cursor(), 2.0);

    engine.jumpTo(-3.0);
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(engine.state().board == Board::startingPosition());

    QCOMPARE(engine.cursorAt(0), 0.0);
    QCOMPARE(engine.cursorAt(3), 1.5);
    QCOMPARE(engine.cursorAt(99), 2.0);
}

void TestReplayEngine::castlingHighlight() {
    ReplayEngine engine;
    engine.loadGame(parseOne("1. e4 e5 2. Nf3 Nc6 3. Bc4 Bc5 4. O-O"));

    engine.last();
    QCOMPARE(engine.cursor(), 3.5);

    const auto& st = engine.state();
    QVERIFY(holds(st.board, "g1", Side::White, PieceKind::King));
    QVERIFY(holds(st.board, "f1", Side::White, PieceKind::Rook));
    QVERIFY(!st.board.pieceAt("e1").has_value());
    QVERIFY(!st.board.pieceAt("h1").has_value());

    QVERIFY(st.lastMove.has_value());
    QCOMPARE(QString::fromStdString(st.lastMove->from.toString()), QStringLiteral("e1"));
    QCOMPARE(QString::fromStdString(st.lastMove->to.toString()), QStringLiteral("g1"));
    QVERIFY(engine.unresolvedMoves().empty());
}

void TestReplayEngine::unresolvedMovesAreReported() {
    ReplayEngine engine;
    engine.loadGame(parseOne("1. e4 e5 2. Nd5 Nc6 *"));

    engine.next();
    engine.next();
    const Board before = engine.state().board;

    engine.next();
    QCOMPARE(engine.cursor(), 1.5);
    QVERIFY(engine.state().board == before);
    QCOMPARE(static_cast<int>(engine.unresolvedMoves().size()), 1);

    const auto& u = engine.unresolvedMoves().front();
    QCOMPARE(static_cast<int>(u.recordIndex), 1);
    QVERIFY(u.side == Side::White);
    QCOMPARE(QString::fromStdString(u.token), QStringLiteral("Nd5"));
    QVERIFY(!u.error.empty());

    engine.last();
    QCOMPARE(static_cast<int>(engine.unresolvedMoves().size()), 1);

    engine.first();
    QVERIFY(engine.unresolvedMoves().empty());
}

void TestReplayEngine::loadGameReplacesState() {
    ReplayEngine engine;
    engine.loadGame(parseOne(kScenario));
    engine.last();

    engine.loadGame(parseOne("[Event \"Other\"]\n\n1. d4 *"));
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(engine.state().board == Board::startingPosition());
    QVERIFY(!engine.state().lastMove.has_value());
    QCOMPARE(QString::fromStdString(engine.state().metadata.event.value_or("")), QStringLiteral("Other"));
    QCOMPARE(static_cast<int>(engine.state().moves.size()), 1);
    QCOMPARE(static_cast<int>(engine.halfMoveCount()), 1);
}

void TestReplayEngine::emptyGame() {
    ReplayEngine engine;
    engine.loadGame(parseOne("[Event \"Empty\"]\n\n*"));

    engine.next();
    engine.last();
    engine.previous();
    QCOMPARE(engine.cursor(), 0.0);
    QVERIFY(!engine.hasNextMove());
    QVERIFY(engine.state().board == Board::startingPosition());
}

QTEST_APPLESS_MAIN(TestReplayEngine)
#include "tst_replay_engine.moc"
