#include "io/ByteFileIo.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "debug/EditTrace.h"

namespace hexgrid {

std::optional<QByteArray> ByteFileIo::loadFile(const QString& filePath) {
    if (filePath.isEmpty()) {
        return std::nullopt;
    }
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        return std::nullopt;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning().noquote() << QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        return std::nullopt;
    }
    QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        qWarning().noquote() << QStringLiteral("Cannot read %1: %2").arg(filePath, file.errorString());
        return std::nullopt;
    }
    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("ByteFileIo::loadFile: path=%1 bytes=%2")
                              .arg(filePath)
                              .arg(bytes.size()));
    }
    return bytes;
}

bool ByteFileIo::saveFile(const QString& filePath, const QByteArray& bytes) {
    if (filePath.isEmpty()) {
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning().noquote() << QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        qWarning().noquote() << QStringLiteral("Short write to %1: %2").arg(filePath, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning().noquote() << QStringLiteral("Cannot commit %1: %2").arg(filePath, file.errorString());
        return false;
    }
    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("ByteFileIo::saveFile: path=%1 bytes=%2")
                              .arg(filePath)
                              .arg(bytes.size()));
    }
    return true;
}

bool ByteFileIo::isWritable(const QString& filePath) {
    const QFileInfo info(filePath);
    return info.exists() && info.isWritable();
}

}  // namespace hexgrid
