#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "domain/pgn/PgnParser.hpp"
#include "infra/PgnFileRepository.hpp"
#include "infra/ViewerConfigRepository.hpp"

using pgnreplay::app::ViewerConfig;
using pgnreplay::domain::ErrorKind;
using pgnreplay::infra::PgnFileRepository;
using pgnreplay::infra::ViewerConfigRepository;

namespace {

void writeBytes(const QString& path, const QByteArray& bytes) {
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(bytes);
    f.close();
}

} // namespace

class TestInfra : public QObject {
    Q_OBJECT

private slots:
    void readMissingFile();
    void writeThenRead();
    void readWithByteOrderMark();
    void readInvalidUtf8();
    void writeIntoMissingDirectory();

    void configDefaultsWhenMissing();
    void configDefaultsWhenInvalid();
    void configPerKeyDefaults();
    void configNegativeContextMoves();
    void configSaveLoad();
};

void TestInfra::readMissingFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    PgnFileRepository repo;
    const auto r = repo.read(dir.filePath(QStringLiteral("none.pgn")).toStdString());
    QVERIFY(!r.ok);
    QVERIFY(r.kind == ErrorKind::UnreadableSource);
    QVERIFY(!r.error.empty());
}

void TestInfra::writeThenRead() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const std::string path = dir.filePath(QStringLiteral("game.pgn")).toStdString();
    const std::string text = "[White \"R\xc3\xa9ti, Richard\"]\n\n1. Nf3 d5 *\n";

    PgnFileRepository repo;
    QVERIFY(repo.write(path, text).ok);

    const auto r = repo.read(path);
    QVERIFY(r.ok);
    QCOMPARE(QString::fromStdString(r.content), QString::fromStdString(text));
}

void TestInfra::readWithByteOrderMark() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("bom.pgn"));
    writeBytes(path, QByteArray("\xEF\xBB\xBF[Event \"BOM\"]\r\n\r\n1. e4 e5 1-0\r\n"));

    PgnFileRepository repo;
    const auto r = repo.read(path.toStdString());
    QVERIFY(r.ok);

    const auto games = pgnreplay::domain::pgn::parsePgnText(r.content);
    QCOMPARE(static_cast<int>(games.size()), 1);
    QCOMPARE(QString::fromStdString(games[0].metadata.event.value_or("")), QStringLiteral("BOM"));
    QCOMPARE(static_cast<int>(games[0].moves.size()), 1);
}

void TestInfra::readInvalidUtf8() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("latin1.pgn"));
    writeBytes(path, QByteArray("[White \"R\xe9ti\"]\n\n1. Nf3 *\n"));

    PgnFileRepository repo;
    const auto r = repo.read(path.toStdString());
    QVERIFY(!r.ok);
    QVERIFY(r.kind == ErrorKind::UnreadableSource);
}

void TestInfra::writeIntoMissingDirectory() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    PgnFileRepository repo;
    const auto r = repo.write(dir.filePath(QStringLiteral("no/such/dir/x.pgn")).toStdString(), "*\n");
    QVERIFY(!r.ok);
    QVERIFY(r.kind == ErrorKind::UnreadableSource);
}

void TestInfra::configDefaultsWhenMissing() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    ViewerConfigRepository repo(dir.filePath(QStringLiteral("viewer.json")).toStdString());
    const ViewerConfig c = repo.load();
    const ViewerConfig defaults;
    QCOMPARE(c.contextMoves, defaults.contextMoves);
    QCOMPARE(c.flipBoard, defaults.flipBoard);
    QCOMPARE(c.showHighlights, defaults.showHighlights);
    QVERIFY(c.lastFile.empty());
}

void TestInfra::configDefaultsWhenInvalid() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("viewer.json"));
    writeBytes(path, QByteArray("{ not json"));

    ViewerConfigRepository repo(path.toStdString());
    const ViewerConfig c = repo.load();
    QCOMPARE(c.contextMoves, ViewerConfig{}.contextMoves);
    QCOMPARE(c.showHighlights, true);
}

void TestInfra::configPerKeyDefaults() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("viewer.json"));
    writeBytes(path, QByteArray("{ \"flip_board\": true, \"context_moves\": \"many\" }"));

    ViewerConfigRepository repo(path.toStdString());
    const ViewerConfig c = repo.load();
    QCOMPARE(c.flipBoard, true);
    QCOMPARE(c.contextMoves, ViewerConfig{}.contextMoves);
    QCOMPARE(c.showHighlights, true);
    QVERIFY(c.lastFile.empty());
}

void TestInfra::configNegativeContextMoves() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("viewer.json"));
    writeBytes(path, QByteArray("{ \"context_moves\": -3 }"));

    ViewerConfigRepository repo(path.toStdString());
    QCOMPARE(repo.load().contextMoves, ViewerConfig{}.contextMoves);
}

void TestInfra::configSaveLoad() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ViewerConfigRepository repo(dir.filePath(QStringLiteral("viewer.json")).toStdString());

    ViewerConfig c;
    c.contextMoves = 12;
    c.flipBoard = true;
    c.showHighlights = false;
    c.lastFile = "/tmp/games.pgn";
    repo.save(c);

    const ViewerConfig back = repo.load();
    QCOMPARE(back.contextMoves, 12);
    QCOMPARE(back.flipBoard, true);
    QCOMPARE(back.showHighlights, false);
    QCOMPARE(QString::fromStdString(back.lastFile), QStringLiteral("/tmp/games.pgn"));
}

QTEST_APPLESS_MAIN(TestInfra)
#include "tst_infra.moc"
