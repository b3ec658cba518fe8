#pragma once

#include <QByteArray>
#include <QObject>
#include <QtGlobal>

namespace hexgrid {

// Byte sequence edited by the grid. Owned by the host; the engine only keeps a
// non-owning pointer. Implementations emit lengthChanged()/contentChanged()
// after a mutation has completed, never while it is in progress.
class ByteStore : public QObject {
    Q_OBJECT

public:
    explicit ByteStore(QObject* parent = nullptr);
    ~ByteStore() override;

    virtual qint64 length() const = 0;

    // Throws std::out_of_range when offset is not in [0, length).
    virtual quint8 readByte(qint64 offset) const = 0;

    // Returns fewer than count bytes when the range runs past the end.
    virtual QByteArray readRange(qint64 offset, qint64 count) const;

    virtual void writeByte(qint64 offset, quint8 value) = 0;
    virtual void insertBytes(qint64 offset, const QByteArray& bytes) = 0;
    virtual void deleteBytes(qint64 offset, qint64 count) = 0;

    virtual bool supportsWrite() const = 0;
    virtual bool supportsInsert() const = 0;
    virtual bool supportsDelete() const = 0;

    virtual bool hasChanges() const = 0;
    virtual void applyChanges() = 0;

signals:
    void lengthChanged();
    void contentChanged();

protected:
    void checkReadOffset(qint64 offset) const;
    void checkInsertOffset(qint64 offset) const;
    void checkDeleteRange(qint64 offset, qint64 count) const;
};

}  // namespace hexgrid
