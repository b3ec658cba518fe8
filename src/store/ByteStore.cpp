#include "store/ByteStore.h"

#include <stdexcept>
#include <string>

namespace hexgrid {

ByteStore::ByteStore(QObject* parent) : QObject(parent) {}

ByteStore::~ByteStore() = default;

QByteArray ByteStore::readRange(qint64 offset, qint64 count) const {
    QByteArray out;
    if (offset < 0 || count <= 0) {
        return out;
    }
    const qint64 end = qMin(length(), offset + count);
    if (end <= offset) {
        return out;
    }
    out.resize(static_cast<qsizetype>(end - offset));
    for (qint64 i = offset; i < end; ++i) {
        out[static_cast<qsizetype>(i - offset)] = static_cast<char>(readByte(i));
    }
    return out;
}

void ByteStore::checkReadOffset(qint64 offset) const {
    if (offset < 0 || offset >= length()) {
        throw std::out_of_range("byte offset " + std::to_string(offset) +
                                " outside [0, " + std::to_string(length()) + ")");
    }
}

void ByteStore::checkInsertOffset(qint64 offset) const {
    if (offset < 0 || offset > length()) {
        throw std::out_of_range("insert offset " + std::to_string(offset) +
                                " outside [0, " + std::to_string(length()) + "]");
    }
}

void ByteStore::checkDeleteRange(qint64 offset, qint64 count) const {
    if (offset < 0 || count < 0 || offset + count > length()) {
        throw std::out_of_range("delete range [" + std::to_string(offset) + ", +" +
                                std::to_string(count) + ") outside store of length " +
                                std::to_string(length()));
    }
}

}  // namespace hexgrid
