#include "grid/ScrollController.h"

#include <cmath>
#include <stdexcept>

#include "debug/EditTrace.h"

namespace hexgrid {

void ScrollController::reset() {
    m_length = 0;
    m_scrollMax = 0;
    m_scrollPos = 0;
}

void ScrollController::setBytesPerLine(int bytesPerLine) {
    if (bytesPerLine < 1) {
        throw std::invalid_argument("bytesPerLine must be at least 1");
    }
    m_bytesPerLine = bytesPerLine;
}

void ScrollController::setVisibleLines(int visibleLines) { m_visibleLines = qMax(1, visibleLines); }

void ScrollController::setVisibleByteRange(qint64 count) {
    m_visibleLines = static_cast<int>(qMax<qint64>(1, count / m_bytesPerLine));
}

bool ScrollController::recomputeBounds(qint64 length) {
    m_length = qMax<qint64>(0, length);
    // One extra position for the append cursor past the last byte.
    const qint64 lineCount = (m_length + m_bytesPerLine) / m_bytesPerLine;
    const qint64 newMax = qMax<qint64>(0, lineCount - m_visibleLines);

    const qint64 oldMax = m_scrollMax;
    const qint64 oldPos = m_scrollPos;
    if (newMax < m_scrollMax && m_scrollPos == m_scrollMax) {
        // Data shrank while the view was at the bottom.
        m_scrollPos = qMax<qint64>(0, m_scrollPos - 1);
    }
    m_scrollMax = newMax;
    m_scrollPos = qMin(m_scrollPos, m_scrollMax);

    const bool changed = oldMax != m_scrollMax || oldPos != m_scrollPos;
    if (changed && debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("ScrollController::recomputeBounds: length=%1 max=%2 pos=%3")
                              .arg(m_length)
                              .arg(m_scrollMax)
                              .arg(m_scrollPos));
    }
    return changed;
}

bool ScrollController::scrollToLine(qint64 line) {
    const qint64 clamped = qBound<qint64>(0, line, m_scrollMax);
    if (clamped == m_scrollPos) {
        return false;
    }
    m_scrollPos = clamped;
    return true;
}

bool ScrollController::scrollLines(qint64 delta) {
    if (delta == 0) {
        return false;
    }
    return scrollToLine(m_scrollPos + delta);
}

bool ScrollController::scrollPages(qint64 pages) {
    return scrollLines(pages * static_cast<qint64>(m_visibleLines));
}

bool ScrollController::scrollByteIntoView(qint64 offset) {
    if (offset < firstVisibleByte()) {
        return scrollToLine(offset / m_bytesPerLine);
    }
    if (offset > lastFullyVisibleByte()) {
        return scrollToLine(offset / m_bytesPerLine - (m_visibleLines - 1));
    }
    return false;
}

bool ScrollController::thumbTrackTo(int nativeValue) {
    qint64 line = fromNative(nativeValue);
    if (m_scrollMax >= kNativeMax && nativeMaximum() - toNative(line) <= kThumbSnapTolerance) {
        // Proportional rounding must never hide the last line from a drag.
        line = m_scrollMax;
    }
    return scrollToLine(line);
}

int ScrollController::bytesPerLine() const { return m_bytesPerLine; }

int ScrollController::visibleLines() const { return m_visibleLines; }

qint64 ScrollController::visibleBytes() const {
    return static_cast<qint64>(m_bytesPerLine) * m_visibleLines;
}

qint64 ScrollController::length() const { return m_length; }

qint64 ScrollController::scrollMin() const { return 0; }

qint64 ScrollController::scrollMax() const { return m_scrollMax; }

qint64 ScrollController::scrollPos() const { return m_scrollPos; }

qint64 ScrollController::firstVisibleByte() const { return m_scrollPos * m_bytesPerLine; }

qint64 ScrollController::lastVisibleByte() const {
    return qMin(m_length - 1, firstVisibleByte() + visibleBytes());
}

qint64 ScrollController::lastFullyVisibleByte() const {
    return firstVisibleByte() + visibleBytes() - 1;
}

int ScrollController::nativeMaximum() const {
    return static_cast<int>(qMin<qint64>(m_scrollMax, kNativeMax));
}

int ScrollController::nativeValue() const { return toNative(m_scrollPos); }

int ScrollController::toNative(qint64 scrollPos) const {
    if (m_scrollMax < kNativeMax) {
        return static_cast<int>(scrollPos);
    }
    const double percent = static_cast<double>(scrollPos) / static_cast<double>(m_scrollMax) * 100.0;
    const qint64 native =
        static_cast<qint64>(std::floor(static_cast<double>(kNativeMax) / 100.0 * percent));
    return static_cast<int>(qBound<qint64>(0, native, kNativeMax));
}

qint64 ScrollController::fromNative(int nativeValue) const {
    if (m_scrollMax < kNativeMax) {
        return nativeValue;
    }
    const double percent = static_cast<double>(nativeValue) / static_cast<double>(kNativeMax) * 100.0;
    const qint64 line =
        static_cast<qint64>(std::floor(static_cast<double>(m_scrollMax) / 100.0 * percent));
    return qBound<qint64>(0, line, m_scrollMax);
}

}  // namespace hexgrid
