#pragma once

#include <QMainWindow>
#include <optional>
#include <vector>

#include "app/IViewerConfigRepository.hpp"
#include "domain/chess/GameState.hpp"
#include "domain/domain_model.hpp"
#include "ui/GamesModel.hpp"

class QAction;
class QLabel;
class QListWidget;
class QPushButton;
class QTableView;
class QItemSelectionModel;
class QVBoxLayout;

namespace pgnreplay::app {
class ReplaySession;
}

namespace pgnreplay::ui {

class BoardWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(pgnreplay::app::ReplaySession& session,
               pgnreplay::app::IViewerConfigRepository* configRepo = nullptr,
               QWidget* parent = nullptr);
    ~MainWindow() override;

    // Opens a PGN file and selects its first game. Errors go to a message box.
    bool openPgn(const QString& path);

    // Session notifications (wired through ReplaySessionCallbacks).
    void notifyGamesLoaded(const std::vector<pgnreplay::domain::Game>& games);
    void notifyGameSelected(const pgnreplay::domain::Game& game);
    void notifyPositionChanged(const pgnreplay::domain::chess::PositionSnapshot& pos);

protected:
    void closeEvent(QCloseEvent* ev) override;

private slots:
    void onOpenTriggered();
    void onSaveAsTriggered();
    void onCopyContextTriggered();
    void onGameSelectionChanged();
    void onMoveSelectionChanged();
    void onFirstClicked();
    void onPrevClicked();
    void onNextClicked();
    void onLastClicked();
    void onFlipToggled(bool checked);
    void onHighlightsToggled(bool checked);

private:
    void setupUi();
    void setupMenu();
    void setupNavigation(QWidget* parent, QVBoxLayout* layout);
    void setupConnections();

    void rebuildMovesList();
    void syncMovesSelection(std::size_t ply);
    void updateHeader(const pgnreplay::domain::Game& game);
    void updateBoard(const pgnreplay::domain::chess::PositionSnapshot& pos);
    std::optional<int> selectedGameRow() const;

    pgnreplay::app::ReplaySession&           session_;
    pgnreplay::app::IViewerConfigRepository* configRepo_{nullptr};
    pgnreplay::app::ViewerConfig             config_;

    GamesModel      gamesModel_;

    QTableView*     gamesTableView_{nullptr};
    BoardWidget*    boardWidget_{nullptr};
    QListWidget*    movesList_{nullptr};
    QLabel*         headerLabel_{nullptr};
    QLabel*         contextLabel_{nullptr};

    QPushButton*    firstBtn_{nullptr};
    QPushButton*    prevBtn_{nullptr};
    QPushButton*    nextBtn_{nullptr};
    QPushButton*    lastBtn_{nullptr};

    QAction*        saveAction_{nullptr};
    QAction*        copyContextAction_{nullptr};
    QAction*        flipAction_{nullptr};
    QAction*        highlightsAction_{nullptr};

    bool            ignoreSelection_{false};
};

} // namespace pgnreplay::ui
