#pragma once

#include <optional>

#include <QByteArray>
#include <QChar>

#include "edit/ClipboardCodec.h"
#include "edit/EditorState.h"
#include "edit/KeyBindings.h"

namespace hexgrid::input {

// Command handlers. Each one switches on state.mode for the parts that differ
// between hex-pair and character entry. Handlers return false when the input
// was not consumed and should fall through to the host.
bool execute(EditorState& state, EditorCommand command, ClipboardAccess* clipboard);
bool enterCharacter(EditorState& state, QChar ch);

bool moveLeft(EditorState& state);
bool moveRight(EditorState& state);
bool moveUp(EditorState& state);
bool moveDown(EditorState& state);
bool pageUp(EditorState& state);
bool pageDown(EditorState& state);
bool moveHome(EditorState& state);
bool moveEnd(EditorState& state);
bool extendSelection(EditorState& state, qint64 delta);
bool deleteBackward(EditorState& state);
bool deleteForward(EditorState& state);
bool nextPane(EditorState& state);
bool previousPane(EditorState& state);
bool toggleInsert(EditorState& state);

bool canCopy(const EditorState& state);
bool canCut(const EditorState& state);
bool canPaste(const EditorState& state, const ClipboardAccess& clipboard);
bool canPasteHex(const EditorState& state, const ClipboardAccess& clipboard);
std::optional<CopyPayload> copy(EditorState& state, ClipboardAccess& clipboard, bool asHex);
bool cut(EditorState& state, ClipboardAccess& clipboard);
bool paste(EditorState& state, ClipboardAccess& clipboard, bool asHex);
// Replaces the selection (or payload-length bytes in overwrite-paste mode) with
// bytes and places the cursor after them.
bool pasteBytes(EditorState& state, const QByteArray& bytes);

// Shared by the handlers above and by the engine.
void setPosition(EditorState& state, qint64 offset, int subBytePos);
void selectRange(EditorState& state, qint64 start, qint64 length);
void releaseSelection(EditorState& state);
void scrollCursorIntoView(EditorState& state);
void scrollOffsetIntoView(EditorState& state, qint64 offset);
void refreshScrollBounds(EditorState& state);
void setInputMode(EditorState& state, InputMode mode);
void setInsertActive(EditorState& state, bool active);

}  // namespace hexgrid::input
