#include "edit/InputModeMachine.h"

#include <QDebug>

#include "debug/EditTrace.h"

namespace hexgrid::input {

namespace {

int hexNibble(QChar ch) {
    const char16_t c = ch.unicode();
    if (c >= u'0' && c <= u'9') {
        return c - u'0';
    }
    if (c >= u'a' && c <= u'f') {
        return c - u'a' + 10;
    }
    if (c >= u'A' && c <= u'F') {
        return c - u'A' + 10;
    }
    return -1;
}

void markMutated(EditorState& state) {
    state.pending |= EditorEvent::ContentChanged | EditorEvent::RepaintNeeded;
}

void deleteRange(EditorState& state, qint64 offset, qint64 count) {
    state.store->deleteBytes(offset, count);
    markMutated(state);
    refreshScrollBounds(state);
}

void insertRange(EditorState& state, qint64 offset, const QByteArray& bytes) {
    state.store->insertBytes(offset, bytes);
    markMutated(state);
    refreshScrollBounds(state);
}

// Single-byte step left or right used by character entry and Backspace.
void stepByte(EditorState& state, qint64 delta) {
    const qint64 pos = state.selection.cursor();
    const qint64 target = qBound<qint64>(0, pos + delta, state.length());
    if (target != pos) {
        setPosition(state, target, 0);
    }
    scrollCursorIntoView(state);
}

// Nibble step right used by hex entry.
void stepNibbleRight(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    const int cPos = state.selection.subBytePos();
    if (!(pos == state.length() && cPos == 0)) {
        if (cPos > 0) {
            setPosition(state, qMin(state.length(), pos + 1), 0);
        } else {
            setPosition(state, pos, 1);
        }
    }
    scrollCursorIntoView(state);
}

// Deletes the active selection before typed input replaces it. Returns true
// when the selection was removed and the typed byte must be inserted.
bool replaceSelectionForTyping(EditorState& state) {
    const qint64 selLen = state.selection.selectionLength();
    const EditOptions& opts = state.options;
    const bool replace = opts.enableCut && opts.enableDelete && opts.enablePaste &&
                         state.store->supportsDelete() && state.store->supportsInsert() &&
                         selLen > 0;
    if (replace) {
        const qint64 pos = state.selection.cursor();
        deleteRange(state, pos, selLen);
        setPosition(state, pos, 0);
    }
    releaseSelection(state);
    return replace;
}

bool enterHexDigit(EditorState& state, int nibble) {
    ByteStore* store = state.store;
    const qint64 pos = state.selection.cursor();
    const int cPos = state.selection.subBytePos();

    bool insert = pos == store->length();
    if (!insert && store->supportsInsert() && state.insertActive && cPos == 0) {
        insert = true;
    }
    if (replaceSelectionForTyping(state)) {
        insert = true;
    }
    const int subPos = state.selection.subBytePos();

    const quint8 current = insert ? 0 : store->readByte(pos);
    const quint8 value = subPos == 0
                             ? static_cast<quint8>((nibble << 4) | (current & 0x0F))
                             : static_cast<quint8>((current & 0xF0) | nibble);
    if (insert) {
        insertRange(state, pos, QByteArray(1, static_cast<char>(value)));
    } else {
        store->writeByte(pos, value);
        markMutated(state);
    }
    state.changes.markDirty(pos);
    stepNibbleRight(state);
    return true;
}

bool enterCharByte(EditorState& state, QChar ch) {
    ByteStore* store = state.store;
    const qint64 pos = state.selection.cursor();

    bool insert = pos == store->length();
    if (!insert && store->supportsInsert() && state.insertActive) {
        insert = true;
    }
    if (replaceSelectionForTyping(state)) {
        insert = true;
    }

    const quint8 value = state.converter->charToByte(ch);
    if (insert) {
        insertRange(state, pos, QByteArray(1, static_cast<char>(value)));
    } else {
        store->writeByte(pos, value);
        markMutated(state);
    }
    state.changes.markDirty(pos);
    stepByte(state, 1);
    return true;
}

std::optional<QByteArray> clipboardBytes(const EditorState& state, const ClipboardAccess& clipboard,
                                         bool asHex) {
    if (asHex) {
        if (clipboard.hasText()) {
            return ClipboardCodec::parseHexText(clipboard.text());
        }
        if (clipboard.hasRawBytes()) {
            return clipboard.rawBytes();
        }
        return std::nullopt;
    }
    if (clipboard.hasRawBytes()) {
        return clipboard.rawBytes();
    }
    if (clipboard.hasText()) {
        return state.converter->encodeText(clipboard.text());
    }
    return std::nullopt;
}

}  // namespace

bool execute(EditorState& state, EditorCommand command, ClipboardAccess* clipboard) {
    if (!state.hasStore() || state.mode == InputMode::Empty || command == EditorCommand::None) {
        return false;
    }
    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("execute: %1 mode=%2 pos=%3 sub=%4 sel=%5")
                              .arg(QString::fromLatin1(KeyBindings::commandName(command)))
                              .arg(static_cast<int>(state.mode))
                              .arg(state.selection.cursor())
                              .arg(state.selection.subBytePos())
                              .arg(state.selection.selectionLength()));
    }

    const qint64 bytesPerLine = state.scroll.bytesPerLine();
    switch (command) {
        case EditorCommand::MoveLeft:
            return moveLeft(state);
        case EditorCommand::MoveRight:
            return moveRight(state);
        case EditorCommand::MoveUp:
            return moveUp(state);
        case EditorCommand::MoveDown:
            return moveDown(state);
        case EditorCommand::PageUp:
            return pageUp(state);
        case EditorCommand::PageDown:
            return pageDown(state);
        case EditorCommand::MoveHome:
            return moveHome(state);
        case EditorCommand::MoveEnd:
            return moveEnd(state);
        case EditorCommand::ExtendLeft:
            return extendSelection(state, -1);
        case EditorCommand::ExtendRight:
            return extendSelection(state, 1);
        case EditorCommand::ExtendUp:
            return extendSelection(state, -bytesPerLine);
        case EditorCommand::ExtendDown:
            return extendSelection(state, bytesPerLine);
        case EditorCommand::BeginExtend:
            state.selection.captureAnchor();
            return true;
        case EditorCommand::NextPane:
            return nextPane(state);
        case EditorCommand::PreviousPane:
            return previousPane(state);
        case EditorCommand::DeleteBackward:
            return deleteBackward(state);
        case EditorCommand::DeleteForward:
            return deleteForward(state);
        case EditorCommand::ToggleInsert:
            return toggleInsert(state);
        case EditorCommand::Copy:
            if (clipboard != nullptr) {
                copy(state, *clipboard, state.options.copyKeyAsHex);
            }
            return true;
        case EditorCommand::Cut:
            if (clipboard != nullptr) {
                cut(state, *clipboard);
            }
            return true;
        case EditorCommand::Paste:
            if (clipboard != nullptr) {
                paste(state, *clipboard, false);
            }
            return true;
        case EditorCommand::None:
            break;
    }
    return false;
}

bool enterCharacter(EditorState& state, QChar ch) {
    if (!state.hasStore() || state.mode == InputMode::Empty) {
        return false;
    }
    const int nibble = hexNibble(ch);
    if (state.mode == InputMode::HexEntry && nibble < 0) {
        return false;
    }
    if (state.mode == InputMode::CharEntry && !ch.isPrint()) {
        return false;
    }

    ByteStore* store = state.store;
    const qint64 pos = state.selection.cursor();
    const qint64 length = store->length();
    if ((!store->supportsWrite() && pos != length) || (!store->supportsInsert() && pos == length)) {
        return false;
    }
    if (state.options.readOnly) {
        return true;
    }

    if (state.mode == InputMode::HexEntry) {
        return enterHexDigit(state, nibble);
    }
    return enterCharByte(state, ch);
}

bool moveLeft(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    if (state.selection.hasSelection()) {
        setPosition(state, pos, 0);
        releaseSelection(state);
        scrollCursorIntoView(state);
        return true;
    }

    if (state.mode == InputMode::CharEntry) {
        stepByte(state, -1);
        return true;
    }

    const int cPos = state.selection.subBytePos();
    if (!(pos == 0 && cPos == 0)) {
        if (cPos > 0) {
            setPosition(state, pos, 0);
        } else {
            setPosition(state, qMax<qint64>(0, pos - 1), 1);
        }
    }
    scrollCursorIntoView(state);
    return true;
}

bool moveRight(EditorState& state) {
    if (state.selection.hasSelection()) {
        setPosition(state, state.selection.selectionEnd(), 0);
        releaseSelection(state);
        scrollCursorIntoView(state);
        return true;
    }

    if (state.mode == InputMode::CharEntry) {
        stepByte(state, 1);
    } else {
        stepNibbleRight(state);
    }
    return true;
}

bool moveUp(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    const qint64 bytesPerLine = state.scroll.bytesPerLine();
    if (pos - bytesPerLine >= 0) {
        setPosition(state, pos - bytesPerLine, state.selection.subBytePos());
    }
    releaseSelection(state);
    scrollCursorIntoView(state);
    return true;
}

bool moveDown(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    const qint64 length = state.length();
    const int cPos = state.selection.subBytePos();
    if (!(pos == length && cPos == 0)) {
        const qint64 target = qMin(length, pos + state.scroll.bytesPerLine());
        setPosition(state, target, target == length ? 0 : cPos);
    }
    releaseSelection(state);
    scrollCursorIntoView(state);
    return true;
}

bool pageUp(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    const qint64 target = qMax<qint64>(0, pos - state.scroll.visibleBytes());
    if (target != pos) {
        setPosition(state, target, state.selection.subBytePos());
        if (target < state.scroll.firstVisibleByte() && state.scroll.scrollPages(-1)) {
            state.pending |= EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded;
        }
    }
    releaseSelection(state);
    scrollCursorIntoView(state);
    return true;
}

bool pageDown(EditorState& state) {
    const qint64 pos = state.selection.cursor();
    const qint64 length = state.length();
    const qint64 target = qMin(length, pos + state.scroll.visibleBytes());
    if (target != pos) {
        setPosition(state, target, target == length ? 0 : state.selection.subBytePos());
        if (target > state.scroll.lastFullyVisibleByte() && state.scroll.scrollPages(1)) {
            state.pending |= EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded;
        }
    }
    releaseSelection(state);
    scrollCursorIntoView(state);
    return true;
}

bool moveHome(EditorState& state) {
    if (state.selection.cursor() > 0 || state.selection.subBytePos() != 0) {
        setPosition(state, 0, 0);
        scrollCursorIntoView(state);
    }
    releaseSelection(state);
    return true;
}

bool moveEnd(EditorState& state) {
    const qint64 length = state.length();
    if (state.selection.cursor() != length) {
        setPosition(state, length, 0);
        scrollCursorIntoView(state);
    }
    releaseSelection(state);
    return true;
}

bool extendSelection(EditorState& state, qint64 delta) {
    SelectionModel& selection = state.selection;
    selection.captureAnchor();

    const qint64 anchor = selection.anchor();
    const qint64 pos = selection.cursor();
    // The edge opposite the anchor is the one that moves.
    const qint64 edge = anchor <= pos ? selection.selectionEnd() : pos;
    const qint64 target = edge + delta;
    if (target < 0 || target > state.length()) {
        return true;
    }

    const qint64 start = qMin(anchor, target);
    const qint64 length = qAbs(target - anchor);
    state.pending |= selection.setCursor(start, 0);
    state.pending |= selection.setSelectionLength(length);
    state.pending |= EditorEvent::RepaintNeeded;
    scrollOffsetIntoView(state, target);
    return true;
}

bool deleteBackward(EditorState& state) {
    if (!state.canDelete()) {
        return true;
    }
    const qint64 pos = state.selection.cursor();
    const qint64 selLen = state.selection.selectionLength();
    const int cPos = state.selection.subBytePos();

    const qint64 startDelete = (cPos == 0 && selLen == 0) ? pos - 1 : pos;
    if (startDelete < 0 && selLen < 1) {
        return true;
    }
    const qint64 count = selLen > 0 ? selLen : 1;
    const qint64 start = qMax<qint64>(0, startDelete);
    if (start + count > state.length()) {
        return true;
    }

    deleteRange(state, start, count);
    if (selLen == 0) {
        stepByte(state, -1);
    } else {
        setPosition(state, pos, 0);
    }
    releaseSelection(state);
    return true;
}

bool deleteForward(EditorState& state) {
    if (!state.canDelete()) {
        return true;
    }
    const qint64 pos = state.selection.cursor();
    const qint64 selLen = state.selection.selectionLength();
    if (pos >= state.length()) {
        return true;
    }
    const qint64 count = selLen > 0 ? selLen : 1;
    deleteRange(state, pos, count);
    if (pos >= state.length()) {
        setPosition(state, pos, 0);
    }
    releaseSelection(state);
    return true;
}

bool nextPane(EditorState& state) {
    if (state.mode == InputMode::HexEntry && state.options.layout.charPaneVisible) {
        setInputMode(state, InputMode::CharEntry);
        scrollCursorIntoView(state);
        releaseSelection(state);
        return true;
    }
    state.pending |= EditorEvent::FocusNextRequested;
    return true;
}

bool previousPane(EditorState& state) {
    if (state.mode == InputMode::CharEntry) {
        setInputMode(state, InputMode::HexEntry);
        scrollCursorIntoView(state);
        releaseSelection(state);
        return true;
    }
    state.pending |= EditorEvent::FocusPreviousRequested;
    return true;
}

bool toggleInsert(EditorState& state) {
    setInsertActive(state, !state.insertActive);
    return true;
}

bool canCopy(const EditorState& state) {
    return state.hasStore() && state.selection.selectionLength() >= 1;
}

bool canCut(const EditorState& state) {
    if (state.options.readOnly || !state.options.enableCut || !state.hasStore()) {
        return false;
    }
    return state.selection.selectionLength() >= 1 && state.store->supportsDelete();
}

bool canPaste(const EditorState& state, const ClipboardAccess& clipboard) {
    if (state.options.readOnly || !state.options.enablePaste) {
        return false;
    }
    if (!state.hasStore() || !state.store->supportsInsert()) {
        return false;
    }
    if (!state.store->supportsDelete() && state.selection.selectionLength() > 0) {
        return false;
    }
    return clipboard.hasRawBytes() || clipboard.hasText();
}

bool canPasteHex(const EditorState& state, const ClipboardAccess& clipboard) {
    if (!canPaste(state, clipboard) || !clipboard.hasText()) {
        return false;
    }
    return ClipboardCodec::parseHexText(clipboard.text()).has_value();
}

std::optional<CopyPayload> copy(EditorState& state, ClipboardAccess& clipboard, bool asHex) {
    if (!canCopy(state)) {
        return std::nullopt;
    }
    const QByteArray bytes =
        state.store->readRange(state.selection.selectionStart(), state.selection.selectionLength());
    CopyPayload payload =
        ClipboardCodec::makePayload(bytes, *state.converter, asHex, state.options.hexLowerCase);
    clipboard.setPayload(payload);
    scrollCursorIntoView(state);
    state.pending |= EditorEvent::Copied | EditorEvent::CaretChanged;
    return payload;
}

bool cut(EditorState& state, ClipboardAccess& clipboard) {
    if (!canCut(state)) {
        return false;
    }
    if (!copy(state, clipboard, false).has_value()) {
        return false;
    }
    const qint64 pos = state.selection.cursor();
    deleteRange(state, pos, state.selection.selectionLength());
    setPosition(state, pos, 0);
    scrollCursorIntoView(state);
    releaseSelection(state);
    return true;
}

bool paste(EditorState& state, ClipboardAccess& clipboard, bool asHex) {
    if (!canPaste(state, clipboard)) {
        return false;
    }
    const std::optional<QByteArray> bytes = clipboardBytes(state, clipboard, asHex);
    if (!bytes.has_value()) {
        qWarning().noquote() << QStringLiteral("Rejected hex paste: clipboard text is not hex");
        HEXGRID_EDITTRACE("paste: malformed hex text rejected");
        return false;
    }
    return pasteBytes(state, *bytes);
}

bool pasteBytes(EditorState& state, const QByteArray& bytes) {
    if (!state.hasStore() || bytes.isEmpty()) {
        return false;
    }
    ByteStore* store = state.store;
    const qint64 pos = state.selection.cursor();
    qint64 deleteCount = state.selection.selectionLength();
    if (state.options.enableOverwritePaste) {
        deleteCount = qMin<qint64>(bytes.size(), store->length() - pos);
    }
    if (deleteCount > 0 && !store->supportsDelete()) {
        return false;
    }

    if (deleteCount > 0) {
        deleteRange(state, pos, deleteCount);
    }
    insertRange(state, pos, bytes);
    state.changes.markDirtyRange(pos, bytes.size());
    setPosition(state, pos + bytes.size(), 0);
    releaseSelection(state);
    scrollCursorIntoView(state);
    return true;
}

void setPosition(EditorState& state, qint64 offset, int subBytePos) {
    const int sub = state.mode == InputMode::CharEntry ? 0 : subBytePos;
    state.pending |= state.selection.setCursor(offset, sub);
}

void selectRange(EditorState& state, qint64 start, qint64 length) {
    state.pending |= state.selection.select(start, length);
}

void releaseSelection(EditorState& state) { state.pending |= state.selection.releaseSelection(); }

void scrollCursorIntoView(EditorState& state) {
    scrollOffsetIntoView(state, state.selection.cursor());
}

void scrollOffsetIntoView(EditorState& state, qint64 offset) {
    if (!state.hasStore() || offset < 0) {
        return;
    }
    if (state.scroll.scrollByteIntoView(offset)) {
        state.pending |=
            EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
    state.pending |= EditorEvent::CaretChanged;
}

void refreshScrollBounds(EditorState& state) {
    if (state.scroll.recomputeBounds(state.length())) {
        state.pending |= EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded;
    }
}

void setInputMode(EditorState& state, InputMode mode) {
    if (state.mode == mode) {
        return;
    }
    state.mode = mode;
    state.pending |= state.selection.setCursor(state.selection.cursor(), 0);
    state.pending |=
        EditorEvent::InputModeChanged | EditorEvent::CaretChanged | EditorEvent::RepaintNeeded;
}

void setInsertActive(EditorState& state, bool active) {
    if (state.insertActive == active) {
        return;
    }
    state.insertActive = active;
    state.pending |= EditorEvent::InsertActiveChanged | EditorEvent::CaretChanged;
}

}  // namespace hexgrid::input
