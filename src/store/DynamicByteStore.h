#pragma once

#include <QByteArray>
#include <QSet>

#include "store/ByteStore.h"

namespace hexgrid {

// Growable in-memory store. seedChangedPositions is adopted by the engine when
// it is configured to retain dirty positions across a store swap.
class DynamicByteStore : public ByteStore {
    Q_OBJECT

public:
    explicit DynamicByteStore(const QByteArray& bytes = QByteArray(),
                              const QSet<qint64>& seedChangedPositions = {},
                              QObject* parent = nullptr);

    const QByteArray& bytes() const;
    const QSet<qint64>& seedChangedPositions() const;

    qint64 length() const override;
    quint8 readByte(qint64 offset) const override;
    QByteArray readRange(qint64 offset, qint64 count) const override;
    void writeByte(qint64 offset, quint8 value) override;
    void insertBytes(qint64 offset, const QByteArray& bytes) override;
    void deleteBytes(qint64 offset, qint64 count) override;

    bool supportsWrite() const override;
    bool supportsInsert() const override;
    bool supportsDelete() const override;

    bool hasChanges() const override;
    void applyChanges() override;

private:
    QByteArray m_bytes;
    QSet<qint64> m_seedChangedPositions;
    bool m_hasChanges = false;
};

}  // namespace hexgrid
