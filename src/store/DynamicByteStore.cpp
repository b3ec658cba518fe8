#include "store/DynamicByteStore.h"

#include "debug/EditTrace.h"

namespace hexgrid {

DynamicByteStore::DynamicByteStore(const QByteArray& bytes,
                                   const QSet<qint64>& seedChangedPositions, QObject* parent)
    : ByteStore(parent), m_bytes(bytes), m_seedChangedPositions(seedChangedPositions) {}

const QByteArray& DynamicByteStore::bytes() const { return m_bytes; }

const QSet<qint64>& DynamicByteStore::seedChangedPositions() const {
    return m_seedChangedPositions;
}

qint64 DynamicByteStore::length() const { return static_cast<qint64>(m_bytes.size()); }

quint8 DynamicByteStore::readByte(qint64 offset) const {
    checkReadOffset(offset);
    return static_cast<quint8>(m_bytes.at(static_cast<qsizetype>(offset)));
}

QByteArray DynamicByteStore::readRange(qint64 offset, qint64 count) const {
    if (offset < 0 || count <= 0 || offset >= length()) {
        return QByteArray();
    }
    return m_bytes.mid(static_cast<qsizetype>(offset), static_cast<qsizetype>(count));
}

void DynamicByteStore::writeByte(qint64 offset, quint8 value) {
    checkReadOffset(offset);
    m_bytes[static_cast<qsizetype>(offset)] = static_cast<char>(value);
    m_hasChanges = true;
    emit contentChanged();
}

void DynamicByteStore::insertBytes(qint64 offset, const QByteArray& bytes) {
    checkInsertOffset(offset);
    if (bytes.isEmpty()) {
        return;
    }
    m_bytes.insert(static_cast<qsizetype>(offset), bytes);
    m_hasChanges = true;
    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("DynamicByteStore::insertBytes: offset=%1 count=%2 length=%3")
                              .arg(offset)
                              .arg(bytes.size())
                              .arg(m_bytes.size()));
    }
    emit lengthChanged();
    emit contentChanged();
}

void DynamicByteStore::deleteBytes(qint64 offset, qint64 count) {
    checkDeleteRange(offset, count);
    if (count == 0) {
        return;
    }
    m_bytes.remove(static_cast<qsizetype>(offset), static_cast<qsizetype>(count));
    m_hasChanges = true;
    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("DynamicByteStore::deleteBytes: offset=%1 count=%2 length=%3")
                              .arg(offset)
                              .arg(count)
                              .arg(m_bytes.size()));
    }
    emit lengthChanged();
    emit contentChanged();
}

bool DynamicByteStore::supportsWrite() const { return true; }

bool DynamicByteStore::supportsInsert() const { return true; }

bool DynamicByteStore::supportsDelete() const { return true; }

bool DynamicByteStore::hasChanges() const { return m_hasChanges; }

void DynamicByteStore::applyChanges() { m_hasChanges = false; }

}  // namespace hexgrid
