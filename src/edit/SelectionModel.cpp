#include "edit/SelectionModel.h"

#include <stdexcept>

namespace hexgrid {

EditorEvents SelectionModel::reset(bool hasStore) {
    m_hasStore = hasStore;
    m_subBytePos = 0;
    m_anchorValid = false;
    m_anchor = 0;

    EditorEvents events;
    const qint64 cursor = hasStore ? 0 : -1;
    if (m_cursor != cursor) {
        m_cursor = cursor;
        events |= EditorEvent::SelectionStartChanged;
    }
    if (m_selectionLength != 0) {
        m_selectionLength = 0;
        events |= EditorEvent::SelectionLengthChanged;
    }
    events |= refreshDerived();
    return events | EditorEvent::CaretChanged;
}

EditorEvents SelectionModel::setBytesPerLine(int bytesPerLine) {
    if (bytesPerLine < 1) {
        throw std::invalid_argument("bytesPerLine must be at least 1");
    }
    m_bytesPerLine = bytesPerLine;
    return refreshDerived();
}

EditorEvents SelectionModel::setCursor(qint64 offset, int subBytePos) {
    EditorEvents events;
    const int clampedSub = qBound(0, subBytePos, 1);
    if (m_subBytePos != clampedSub) {
        m_subBytePos = clampedSub;
        events |= EditorEvent::CaretChanged;
    }
    if (offset != m_cursor) {
        m_cursor = offset;
        events |= EditorEvent::SelectionStartChanged | EditorEvent::CaretChanged;
        events |= refreshDerived();
    }
    return events;
}

EditorEvents SelectionModel::setCursorOffset(qint64 offset) { return setCursor(offset, m_subBytePos); }

EditorEvents SelectionModel::setSelectionLength(qint64 length) {
    if (length < 0) {
        throw std::out_of_range("selection length must not be negative");
    }
    if (length == m_selectionLength) {
        return {};
    }
    m_selectionLength = length;
    return EditorEvent::SelectionLengthChanged | EditorEvent::CaretChanged;
}

EditorEvents SelectionModel::select(qint64 start, qint64 length) {
    m_anchorValid = false;
    EditorEvents events = setCursor(start, 0);
    events |= setSelectionLength(length);
    return events | EditorEvent::RepaintNeeded;
}

EditorEvents SelectionModel::releaseSelection() {
    if (m_selectionLength == 0) {
        return {};
    }
    m_selectionLength = 0;
    return EditorEvent::SelectionLengthChanged | EditorEvent::CaretChanged |
           EditorEvent::RepaintNeeded;
}

void SelectionModel::captureAnchor() {
    if (m_selectionLength == 0 || !m_anchorValid) {
        m_anchor = m_cursor;
        m_anchorValid = true;
    }
}

void SelectionModel::setAnchor(qint64 offset) {
    m_anchor = offset;
    m_anchorValid = true;
}

qint64 SelectionModel::anchor() const { return m_anchorValid ? m_anchor : m_cursor; }

qint64 SelectionModel::cursor() const { return m_cursor; }

int SelectionModel::subBytePos() const { return m_subBytePos; }

qint64 SelectionModel::selectionStart() const { return m_cursor; }

qint64 SelectionModel::selectionLength() const { return m_selectionLength; }

qint64 SelectionModel::selectionEnd() const { return m_cursor + m_selectionLength; }

bool SelectionModel::hasSelection() const { return m_selectionLength > 0; }

bool SelectionModel::isSelected(qint64 offset) const {
    return m_selectionLength > 0 && offset >= m_cursor && offset < m_cursor + m_selectionLength;
}

qint64 SelectionModel::currentLine() const { return m_currentLine; }

qint64 SelectionModel::currentPositionInLine() const { return m_currentPositionInLine; }

EditorEvents SelectionModel::refreshDerived() {
    qint64 line = 0;
    qint64 positionInLine = 0;
    if (m_hasStore && m_cursor >= 0) {
        line = m_cursor / m_bytesPerLine + 1;
        positionInLine = m_cursor % m_bytesPerLine + 1;
    }

    EditorEvents events;
    if (line != m_currentLine) {
        m_currentLine = line;
        events |= EditorEvent::CurrentLineChanged;
    }
    if (positionInLine != m_currentPositionInLine) {
        m_currentPositionInLine = positionInLine;
        events |= EditorEvent::CurrentPositionInLineChanged;
    }
    return events;
}

}  // namespace hexgrid
