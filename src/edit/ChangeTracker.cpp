#include "edit/ChangeTracker.h"

#include <algorithm>

namespace hexgrid {

void ChangeTracker::markDirty(qint64 offset) { m_dirty.insert(offset); }

void ChangeTracker::markDirtyRange(qint64 offset, qint64 count) {
    for (qint64 pos = offset; pos < offset + count; ++pos) {
        m_dirty.insert(pos);
    }
}

void ChangeTracker::commit() {
    if (m_dirty.isEmpty()) {
        return;
    }
    m_committed.unite(m_dirty);
    m_dirty.clear();
}

void ChangeTracker::clearDirty() { m_dirty.clear(); }

void ChangeTracker::clearCommitted() { m_committed.clear(); }

void ChangeTracker::adoptDirty(const QSet<qint64>& offsets) { m_dirty = offsets; }

bool ChangeTracker::isDirty(qint64 offset) const { return m_dirty.contains(offset); }

bool ChangeTracker::isCommitted(qint64 offset) const { return m_committed.contains(offset); }

const QSet<qint64>& ChangeTracker::dirty() const { return m_dirty; }

const QSet<qint64>& ChangeTracker::committed() const { return m_committed; }

QVector<qint64> ChangeTracker::allChanged() const {
    QSet<qint64> merged = m_committed;
    merged.unite(m_dirty);
    QVector<qint64> ordered(merged.cbegin(), merged.cend());
    std::sort(ordered.begin(), ordered.end());
    return ordered;
}

}  // namespace hexgrid
