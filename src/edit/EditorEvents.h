#pragma once

#include <QFlags>
#include <QtGlobal>

namespace hexgrid {

// Notifications collected while a command runs and flushed by the engine once
// the command has completed.
enum class EditorEvent : quint32 {
    None = 0,
    ByteStoreChanged = 1U << 0U,
    SelectionStartChanged = 1U << 1U,
    SelectionLengthChanged = 1U << 2U,
    CurrentLineChanged = 1U << 3U,
    CurrentPositionInLineChanged = 1U << 4U,
    InsertActiveChanged = 1U << 5U,
    ReadOnlyChanged = 1U << 6U,
    InputModeChanged = 1U << 7U,
    ScrollChanged = 1U << 8U,
    LayoutChanged = 1U << 9U,
    RequiredWidthChanged = 1U << 10U,
    CaretChanged = 1U << 11U,
    Copied = 1U << 12U,
    RepaintNeeded = 1U << 13U,
    FocusNextRequested = 1U << 14U,
    FocusPreviousRequested = 1U << 15U,
    ContentChanged = 1U << 16U,
};
Q_DECLARE_FLAGS(EditorEvents, EditorEvent)
Q_DECLARE_OPERATORS_FOR_FLAGS(EditorEvents)

}  // namespace hexgrid
