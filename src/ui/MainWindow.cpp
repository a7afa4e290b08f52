#include "ui/MainWindow.hpp"

#include <QAbstractItemView>
#include <QAction>
#include <QClipboard>
#include <QCloseEvent>
#include <QDebug>
#include <QFileDialog>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QKeySequence>
#include <QLabel>
#include <QListWidget>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSplitter>
#include <QStatusBar>
#include <QStringList>
#include <QTableView>
#include <QVBoxLayout>

#include "app/ReplaySession.hpp"
#include "ui/BoardWidget.hpp"
#include "ui/UiFormatters.hpp"

namespace pgnreplay::ui {

using pgnreplay::domain::Game;
using pgnreplay::domain::Side;
using pgnreplay::domain::chess::PositionSnapshot;

MainWindow::MainWindow(pgnreplay::app::ReplaySession& session,
                       pgnreplay::app::IViewerConfigRepository* configRepo,
                       QWidget* parent)
    : QMainWindow(parent)
    , session_(session)
    , configRepo_(configRepo)
    , gamesModel_(this) {
    if (configRepo_) {
        config_ = configRepo_->load();
    }
    setupUi();
    setupConnections();
    notifyPositionChanged(session_.currentPosition());
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    resize(1200, 760);
    setWindowTitle(tr("PGN Replay"));

    setupMenu();

    auto* central = new QWidget(this);
    setCentralWidget(central);
    auto* mainLayout = new QVBoxLayout(central);

    gamesTableView_ = new QTableView(central);
    gamesTableView_->setModel(&gamesModel_);
    gamesTableView_->setSelectionBehavior(QAbstractItemView::SelectRows);
    gamesTableView_->setSelectionMode(QAbstractItemView::SingleSelection);
    gamesTableView_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    gamesTableView_->horizontalHeader()->setStretchLastSection(true);
    gamesTableView_->verticalHeader()->setVisible(false);
    gamesTableView_->setMinimumHeight(140);
    gamesTableView_->setMaximumHeight(220);
    mainLayout->addWidget(gamesTableView_);

    headerLabel_ = new QLabel(central);
    headerLabel_->setWordWrap(true);
    mainLayout->addWidget(headerLabel_);

    auto* splitter = new QSplitter(Qt::Horizontal, central);

    boardWidget_ = new BoardWidget(splitter);
    boardWidget_->setMinimumSize(360, 360);
    boardWidget_->setFlipped(config_.flipBoard);

    movesList_ = new QListWidget(splitter);
    movesList_->setSelectionMode(QAbstractItemView::SingleSelection);
    movesList_->setUniformItemSizes(true);

    splitter->addWidget(boardWidget_);
    splitter->addWidget(movesList_);
    splitter->setStretchFactor(0, 2);
    splitter->setStretchFactor(1, 1);
    mainLayout->addWidget(splitter, 1);

    contextLabel_ = new QLabel(central);
    contextLabel_->setWordWrap(true);
    contextLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    mainLayout->addWidget(contextLabel_);

    setupNavigation(central, mainLayout);
}

void MainWindow::setupMenu() {
    auto* fileMenu = menuBar()->addMenu(tr("&File"));

    auto* openAction = fileMenu->addAction(tr("&Open PGN..."));
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::onOpenTriggered);

    saveAction_ = fileMenu->addAction(tr("&Save game as..."));
    saveAction_->setShortcut(QKeySequence::SaveAs);
    connect(saveAction_, &QAction::triggered, this, &MainWindow::onSaveAsTriggered);

    copyContextAction_ = fileMenu->addAction(tr("&Copy move context"));
    copyContextAction_->setShortcut(QKeySequence::Copy);
    connect(copyContextAction_, &QAction::triggered, this, &MainWindow::onCopyContextTriggered);

    fileMenu->addSeparator();
    auto* quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    auto* viewMenu = menuBar()->addMenu(tr("&View"));

    flipAction_ = viewMenu->addAction(tr("&Flip board"));
    flipAction_->setCheckable(true);
    flipAction_->setChecked(config_.flipBoard);
    flipAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_F));
    connect(flipAction_, &QAction::toggled, this, &MainWindow::onFlipToggled);

    highlightsAction_ = viewMenu->addAction(tr("Show last move"));
    highlightsAction_->setCheckable(true);
    highlightsAction_->setChecked(config_.showHighlights);
    connect(highlightsAction_, &QAction::toggled, this, &MainWindow::onHighlightsToggled);
}

void MainWindow::setupNavigation(QWidget* parent, QVBoxLayout* layout) {
    auto* navLayout = new QHBoxLayout();

    firstBtn_ = new QPushButton(tr("<<"), parent);
    prevBtn_  = new QPushButton(tr("<"), parent);
    nextBtn_  = new QPushButton(tr(">"), parent);
    lastBtn_  = new QPushButton(tr(">>"), parent);

    firstBtn_->setShortcut(QKeySequence(Qt::Key_Home));
    prevBtn_->setShortcut(QKeySequence(Qt::Key_Left));
    nextBtn_->setShortcut(QKeySequence(Qt::Key_Right));
    lastBtn_->setShortcut(QKeySequence(Qt::Key_End));

    navLayout->addStretch(1);
    navLayout->addWidget(firstBtn_);
    navLayout->addWidget(prevBtn_);
    navLayout->addWidget(nextBtn_);
    navLayout->addWidget(lastBtn_);
    navLayout->addStretch(1);

    layout->addLayout(navLayout);
}

void MainWindow::setupConnections() {
    connect(firstBtn_, &QPushButton::clicked, this, &MainWindow::onFirstClicked);
    connect(prevBtn_,  &QPushButton::clicked, this, &MainWindow::onPrevClicked);
    connect(nextBtn_,  &QPushButton::clicked, this, &MainWindow::onNextClicked);
    connect(lastBtn_,  &QPushButton::clicked, this, &MainWindow::onLastClicked);

    connect(movesList_, &QListWidget::currentRowChanged,
            this, &MainWindow::onMoveSelectionChanged);

    if (auto* selectionModel = gamesTableView_->selectionModel(); selectionModel) {
        connect(selectionModel, &QItemSelectionModel::selectionChanged,
                this, &MainWindow::onGameSelectionChanged);
    }
}

bool MainWindow::openPgn(const QString& path) {
    const auto res = session_.openFile(path.toStdString());
    if (!res.ok) {
        QMessageBox::warning(this, tr("Cannot open PGN"), fmt::formatError(res.kind, res.error));
        return false;
    }

    config_.lastFile = path.toStdString();
    if (configRepo_) {
        configRepo_->save(config_);
    }

    if (session_.games().empty()) {
        statusBar()->showMessage(tr("No games found in %1").arg(path));
        return true;
    }

    gamesTableView_->selectRow(0);
    statusBar()->showMessage(tr("Loaded %1 game(s) from %2").arg(session_.games().size()).arg(path), 5000);
    return true;
}

void MainWindow::notifyGamesLoaded(const std::vector<Game>& games) {
    QSignalBlocker blocker(gamesTableView_->selectionModel());
    gamesModel_.setGames(games);
}

void MainWindow::notifyGameSelected(const Game& game) {
    updateHeader(game);
    rebuildMovesList();

    if (!game.skippedTagLines.empty()) {
        statusBar()->showMessage(tr("%1 malformed tag line(s) skipped").arg(game.skippedTagLines.size()), 5000);
    }
}

void MainWindow::notifyPositionChanged(const PositionSnapshot& pos) {
    updateBoard(pos);
    syncMovesSelection(session_.engine().state().ply);

    const bool hasGame = session_.activeGame() != nullptr;
    firstBtn_->setEnabled(pos.hasPrevious);
    prevBtn_->setEnabled(pos.hasPrevious);
    nextBtn_->setEnabled(pos.hasNext);
    lastBtn_->setEnabled(pos.hasNext);
    saveAction_->setEnabled(hasGame);
    copyContextAction_->setEnabled(hasGame);

    QStringList recent;
    const auto contextMoves = static_cast<std::size_t>(qMax(0, config_.contextMoves));
    for (const auto& rec : session_.previousMoves(contextMoves)) {
        recent << QString::fromStdString(rec.text);
    }
    contextLabel_->setText(recent.isEmpty() ? QString() : tr("Recent: %1").arg(recent.join(QStringLiteral("  "))));

    QString status = tr("%1  |  cursor %2  |  %3")
                         .arg(fmt::formatPositionLabel(pos), fmt::formatCursor(pos.cursor),
                              QString::fromStdString(pos.board.toFenPlacement()));
    const auto unresolved = session_.engine().unresolvedMoves().size();
    if (unresolved > 0) {
        status += tr("  |  %1 unresolved move(s)").arg(unresolved);
    }
    statusBar()->showMessage(status);
}

void MainWindow::updateHeader(const Game& game) {
    setWindowTitle(tr("PGN Replay - %1").arg(QString::fromStdString(game.summary())));

    const auto& m = game.metadata;
    QStringList headerLines;
    if (m.event) headerLines << tr("Event: %1").arg(fmt::optionalText(m.event));
    if (m.site)  headerLines << tr("Site: %1").arg(fmt::optionalText(m.site));
    if (m.date)  headerLines << tr("Date: %1").arg(fmt::optionalText(m.date));
    if (m.round) headerLines << tr("Round: %1").arg(fmt::optionalText(m.round));

    const auto& white = session_.whitePlayer();
    const auto& black = session_.blackPlayer();
    if (white || black) {
        headerLines << tr("Players: %1 - %2")
                           .arg(white ? QString::fromStdString(white->name) : QString(),
                                black ? QString::fromStdString(black->name) : QString());
    }
    if (m.result) headerLines << tr("Result: %1").arg(fmt::optionalText(m.result));

    headerLabel_->setText(headerLines.join(QStringLiteral("   ")));
}

void MainWindow::updateBoard(const PositionSnapshot& pos) {
    boardWidget_->setBoard(pos.board);

    QVector<pgnreplay::domain::board::Square> highlights;
    if (config_.showHighlights && pos.lastMove) {
        highlights << pos.lastMove->from << pos.lastMove->to;
    }
    boardWidget_->setHighlights(highlights);
}

// One row per half-move; row i is the position after i + 1 half-moves.
void MainWindow::rebuildMovesList() {
    ignoreSelection_ = true;
    movesList_->clear();

    const auto& engine = session_.engine();
    const auto& moves = engine.state().moves;
    for (const auto& h : engine.halfMoves()) {
        const int moveNo = moves[h.recordIndex].number;
        const QString san = QString::fromStdString(h.token);

        QString text;
        if (h.side == Side::White) {
            text = QString("%1. %2").arg(moveNo).arg(san);
        } else {
            text = QString("%1... %2").arg(moveNo).arg(san);
        }
        movesList_->addItem(new QListWidgetItem(text));
    }

    ignoreSelection_ = false;
}

void MainWindow::syncMovesSelection(std::size_t ply) {
    ignoreSelection_ = true;
    if (ply > 0 && static_cast<int>(ply) <= movesList_->count()) {
        movesList_->setCurrentRow(static_cast<int>(ply) - 1);
    } else {
        movesList_->clearSelection();
        movesList_->setCurrentRow(-1);
    }
    ignoreSelection_ = false;
}

std::optional<int> MainWindow::selectedGameRow() const {
    auto* selectionModel = gamesTableView_ ? gamesTableView_->selectionModel() : nullptr;
    if (!selectionModel) {
        return std::nullopt;
    }

    const auto selected = selectionModel->selectedRows();
    if (selected.isEmpty()) {
        return std::nullopt;
    }
    return selected.first().row();
}

void MainWindow::onOpenTriggered() {
    const QString fileName = QFileDialog::getOpenFileName(
        this,
        tr("Open PGN"),
        QString::fromStdString(config_.lastFile),
        tr("PGN files (*.pgn);;All files (*)"));
    if (fileName.isEmpty()) {
        return;
    }
    openPgn(fileName);
}

void MainWindow::onSaveAsTriggered() {
    if (!session_.activeGame()) {
        return;
    }

    const QString fileName = QFileDialog::getSaveFileName(
        this,
        tr("Save game as PGN"),
        QString(),
        tr("PGN files (*.pgn)"));
    if (fileName.isEmpty()) {
        return;
    }

    const auto res = session_.saveActiveGame(fileName.toStdString());
    if (!res.ok) {
        QMessageBox::warning(this, tr("Error"), fmt::formatError(res.kind, res.error));
        return;
    }
    statusBar()->showMessage(tr("Saved %1").arg(fileName), 5000);
}

void MainWindow::onCopyContextTriggered() {
    if (!session_.activeGame()) {
        return;
    }
    QGuiApplication::clipboard()->setText(QString::fromStdString(session_.moveContext()));
    statusBar()->showMessage(tr("Move context copied"), 3000);
}

void MainWindow::onGameSelectionChanged() {
    const auto row = selectedGameRow();
    if (!row.has_value()) {
        return;
    }
    session_.selectGame(static_cast<std::size_t>(*row));
}

void MainWindow::onMoveSelectionChanged() {
    if (ignoreSelection_) {
        return;
    }
    const int row = movesList_->currentRow();
    if (row < 0) {
        session_.first();
        return;
    }
    session_.jumpTo(session_.engine().cursorAt(static_cast<std::size_t>(row) + 1));
}

void MainWindow::onFirstClicked() {
    session_.first();
}

void MainWindow::onPrevClicked() {
    session_.previous();
}

void MainWindow::onNextClicked() {
    session_.next();
}

void MainWindow::onLastClicked() {
    session_.last();
}

void MainWindow::onFlipToggled(bool checked) {
    config_.flipBoard = checked;
    boardWidget_->setFlipped(checked);
}

void MainWindow::onHighlightsToggled(bool checked) {
    config_.showHighlights = checked;
    updateBoard(session_.currentPosition());
}

void MainWindow::closeEvent(QCloseEvent* ev) {
    if (configRepo_) {
        configRepo_->save(config_);
    }
    QMainWindow::closeEvent(ev);
}

} // namespace pgnreplay::ui
