#include "infra/ViewerConfigRepository.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace pgnreplay::infra {

using pgnreplay::app::ViewerConfig;

ViewerConfigRepository::ViewerConfigRepository(std::string path)
    : path_(std::move(path)) {
}

ViewerConfig ViewerConfigRepository::load() const {
    const ViewerConfig defaults;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Viewer config not found, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open viewer config, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid viewer config, using defaults:" << parseErr.errorString();
        return defaults;
    }

    const auto o = doc.object();

    ViewerConfig c;
    c.contextMoves   = o.value(QStringLiteral("context_moves")).toInt(defaults.contextMoves);
    c.flipBoard      = o.value(QStringLiteral("flip_board")).toBool(defaults.flipBoard);
    c.showHighlights = o.value(QStringLiteral("show_highlights")).toBool(defaults.showHighlights);
    c.lastFile       = o.value(QStringLiteral("last_file")).toString().toStdString();

    if (c.contextMoves < 0) {
        qWarning() << "Invalid context_moves in viewer config, using" << defaults.contextMoves;
        c.contextMoves = defaults.contextMoves;
    }

    return c;
}

void ViewerConfigRepository::save(const ViewerConfig& config) const {
    QJsonObject root;
    root.insert(QStringLiteral("context_moves"),   config.contextMoves);
    root.insert(QStringLiteral("flip_board"),      config.flipBoard);
    root.insert(QStringLiteral("show_highlights"), config.showHighlights);
    root.insert(QStringLiteral("last_file"),       QString::fromStdString(config.lastFile));

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write viewer config:" << QString::fromStdString(path_);
        return;
    }

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
}

} // namespace pgnreplay::infra
