#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QString>
#include <QStringList>

#include "app/ReplaySession.hpp"
#include "infra/PgnFileRepository.hpp"
#include "infra/ViewerConfigRepository.hpp"
#include "ui/MainWindow.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("PgnReplay"));

    const QString appDir = QCoreApplication::applicationDirPath();
    qDebug() << "Application dir:" << appDir;

    const QString configPath = appDir + "/viewer.json";
    qDebug() << "Viewer config path:" << configPath;

    pgnreplay::infra::ViewerConfigRepository configRepo(configPath.toStdString());
    pgnreplay::infra::PgnFileRepository fileRepo;

    pgnreplay::app::ReplaySession session(&fileRepo);

    pgnreplay::ui::MainWindow w(session, &configRepo);
    w.show();

    pgnreplay::app::ReplaySessionCallbacks cb;
    cb.onGamesLoaded = [&](const std::vector<pgnreplay::domain::Game>& games) {
        w.notifyGamesLoaded(games);
    };
    cb.onGameSelected = [&](const pgnreplay::domain::Game& game) {
        w.notifyGameSelected(game);
    };
    cb.onPositionChanged = [&](const pgnreplay::domain::chess::PositionSnapshot& pos) {
        w.notifyPositionChanged(pos);
    };
    session.setCallbacks(std::move(cb));

    // First argument wins over the remembered file.
    const QStringList args = QCoreApplication::arguments();
    QString startFile;
    if (args.size() > 1) {
        startFile = args.at(1);
    } else {
        startFile = QString::fromStdString(configRepo.load().lastFile);
    }

    if (!startFile.isEmpty()) {
        if (QFileInfo::exists(startFile)) {
            w.openPgn(startFile);
        } else {
            qWarning() << "Start file not found:" << startFile;
        }
    }

    return app.exec();
}
