#pragma once

#include <QSet>
#include <QVector>
#include <QtGlobal>

namespace hexgrid {

// Dirty offsets (edited since the last commit) and committed offsets (edited
// and marked finished). Offsets only leave the sets in bulk.
class ChangeTracker {
public:
    void markDirty(qint64 offset);
    void markDirtyRange(qint64 offset, qint64 count);
    void commit();
    void clearDirty();
    void clearCommitted();
    void adoptDirty(const QSet<qint64>& offsets);

    bool isDirty(qint64 offset) const;
    bool isCommitted(qint64 offset) const;
    const QSet<qint64>& dirty() const;
    const QSet<qint64>& committed() const;
    QVector<qint64> allChanged() const;

private:
    QSet<qint64> m_dirty;
    QSet<qint64> m_committed;
};

}  // namespace hexgrid
