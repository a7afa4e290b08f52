#include "infra/PgnFileRepository.hpp"

#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QSaveFile>
#include <QString>
#include <QStringDecoder>

namespace pgnreplay::infra {

using pgnreplay::app::PgnReadResult;
using pgnreplay::domain::ErrorKind;
using pgnreplay::domain::OperationResult;

PgnReadResult PgnFileRepository::read(const std::string& path) const {
    PgnReadResult res;
    const QString qpath = QString::fromStdString(path);

    QFile file(qpath);
    if (!file.exists()) {
        res.kind = ErrorKind::UnreadableSource;
        res.error = "File not found: " + path;
        return res;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        res.kind = ErrorKind::UnreadableSource;
        res.error = "Cannot open " + path + ": " + file.errorString().toStdString();
        return res;
    }

    const QByteArray bytes = file.readAll();
    file.close();

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(bytes);
    if (decoder.hasError()) {
        qWarning() << "PGN is not valid UTF-8:" << qpath;
        res.kind = ErrorKind::UnreadableSource;
        res.error = "File is not valid UTF-8: " + path;
        return res;
    }

    res.ok = true;
    res.content = text.toStdString();
    return res;
}

OperationResult PgnFileRepository::write(const std::string& path, const std::string& content) const {
    OperationResult res;
    const QString qpath = QString::fromStdString(path);

    QSaveFile file(qpath);
    if (!file.open(QIODevice::WriteOnly)) {
        res.kind = ErrorKind::UnreadableSource;
        res.error = "Cannot write " + path + ": " + file.errorString().toStdString();
        return res;
    }

    const QByteArray bytes = QByteArray::fromStdString(content);
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        res.kind = ErrorKind::UnreadableSource;
        res.error = "Failed to write " + path + ": " + file.errorString().toStdString();
        return res;
    }

    qDebug() << "Saved PGN:" << qpath << "bytes:" << bytes.size();
    res.ok = true;
    return res;
}

} // namespace pgnreplay::infra
