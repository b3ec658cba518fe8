#pragma once

#include <QtGlobal>

#include "edit/EditorEvents.h"

namespace hexgrid {

// Cursor, nibble position and selection. The cursor is the selection start;
// the selection extends forward from it by selectionLength() bytes.
class SelectionModel {
public:
    // cursor is -1 while no store is bound.
    EditorEvents reset(bool hasStore);

    EditorEvents setBytesPerLine(int bytesPerLine);

    EditorEvents setCursor(qint64 offset, int subBytePos);
    EditorEvents setCursorOffset(qint64 offset);
    EditorEvents setSelectionLength(qint64 length);
    EditorEvents select(qint64 start, qint64 length);
    EditorEvents releaseSelection();

    // Fixed end of a Shift/drag extension. captureAnchor() keeps an anchor that
    // still belongs to the active selection.
    void captureAnchor();
    void setAnchor(qint64 offset);
    qint64 anchor() const;

    qint64 cursor() const;
    int subBytePos() const;
    qint64 selectionStart() const;
    qint64 selectionLength() const;
    qint64 selectionEnd() const;
    bool hasSelection() const;
    bool isSelected(qint64 offset) const;

    qint64 currentLine() const;
    qint64 currentPositionInLine() const;

private:
    EditorEvents refreshDerived();

    int m_bytesPerLine = 16;
    bool m_hasStore = false;
    qint64 m_cursor = -1;
    int m_subBytePos = 0;
    qint64 m_selectionLength = 0;
    bool m_anchorValid = false;
    qint64 m_anchor = 0;
    qint64 m_currentLine = 0;
    qint64 m_currentPositionInLine = 0;
};

}  // namespace hexgrid
