#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace hexgrid {

class ByteFileIo {
public:
    static std::optional<QByteArray> loadFile(const QString& filePath);
    static bool saveFile(const QString& filePath, const QByteArray& bytes);
    static bool isWritable(const QString& filePath);
};

}  // namespace hexgrid
