#include "engine/HexEditEngine.h"

#include <QCoreApplication>
#include <stdexcept>
#include <utility>

#include "debug/EditTrace.h"
#include "edit/InputModeMachine.h"
#include "store/DynamicByteStore.h"

namespace hexgrid {

namespace {
constexpr int kWheelLinesPerNotch = 3;
constexpr int kWheelNotchDelta = 120;

QString applyHexCase(QString text, bool lowerCase) { return lowerCase ? text : text.toUpper(); }
}  // namespace

// Defers signal emission until the outermost engine call returns.
class HexEditEngine::CommandScope {
public:
    explicit CommandScope(HexEditEngine& engine) : m_engine(engine) { ++m_engine.m_commandDepth; }
    ~CommandScope() {
        if (--m_engine.m_commandDepth == 0) {
            m_engine.flushPending();
        }
    }

    CommandScope(const CommandScope&) = delete;
    CommandScope& operator=(const CommandScope&) = delete;

private:
    HexEditEngine& m_engine;
};

HexEditEngine::HexEditEngine(QObject* parent)
    : QObject(parent), m_bindings(KeyBindings::defaults()), m_clipboard(&m_memoryClipboard) {
    m_find.setYieldCallback([]() {
        if (QCoreApplication::instance() != nullptr) {
            QCoreApplication::processEvents();
        }
    });
    m_state.geometry.setOptions(m_state.options.layout);
    syncLayout();
    m_state.pending = {};
}

HexEditEngine::~HexEditEngine() = default;

bool HexEditEngine::setByteStore(ByteStore* store) {
    if (m_state.store == store) {
        return true;
    }
    if (m_find.isRunning()) {
        HEXGRID_EDITTRACE("HexEditEngine::setByteStore: refused while a find is running");
        m_find.abort();
        return false;
    }
    CommandScope scope(*this);
    if (m_state.store != nullptr) {
        disconnect(m_state.store, nullptr, this, nullptr);
    }
    m_state.store = store;
    if (store != nullptr) {
        connect(store, &ByteStore::lengthChanged, this, &HexEditEngine::onStoreLengthChanged);
        connect(store, &ByteStore::contentChanged, this, &HexEditEngine::onStoreContentChanged);
        connect(store, &QObject::destroyed, this, [this]() {
            // The store is already half destroyed; drop it without touching it.
            m_find.abort();
            m_state.store = nullptr;
            m_pointerDown = false;
            CommandScope scope(*this);
            input::setInputMode(m_state, InputMode::Empty);
            m_state.pending |= m_state.selection.reset(false);
            m_state.scroll.reset();
            m_state.pending |= EditorEvent::ByteStoreChanged | EditorEvent::ScrollChanged |
                               EditorEvent::RepaintNeeded;
        });
    }
    m_pointerDown = false;

    const EditOptions& opts = m_state.options;
    ChangeTracker& changes = m_state.changes;
    if (!opts.retainDirtyOnSwap) {
        changes.clearDirty();
    }
    if (!opts.retainCommittedOnSwap) {
        changes.clearCommitted();
    }
    if (opts.autoCommitOnSwap) {
        changes.commit();
    }
    if (opts.retainDirtyOnSwap) {
        if (const auto* dynamic = qobject_cast<const DynamicByteStore*>(store)) {
            if (!dynamic->seedChangedPositions().isEmpty()) {
                changes.adoptDirty(dynamic->seedChangedPositions());
            }
        }
    }

    input::setInputMode(m_state, store != nullptr ? InputMode::HexEntry : InputMode::Empty);
    m_state.pending |= m_state.selection.reset(store != nullptr);
    m_state.scroll.reset();
    input::refreshScrollBounds(m_state);
    m_state.pending |= EditorEvent::ByteStoreChanged | EditorEvent::ScrollChanged |
                       EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;

    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("HexEditEngine::setByteStore: length=%1 dirty=%2 committed=%3")
                              .arg(m_state.length())
                              .arg(changes.dirty().size())
                              .arg(changes.committed().size()));
    }
    return true;
}

ByteStore* HexEditEngine::byteStore() const { return m_state.store; }

void HexEditEngine::setOptions(const EditOptions& options) {
    if (m_find.isRunning()) {
        return;
    }
    m_state.geometry.setOptions(options.layout);

    CommandScope scope(*this);
    const bool readOnlyChanged = m_state.options.readOnly != options.readOnly;
    m_state.options = options;
    if (readOnlyChanged) {
        m_state.pending |= EditorEvent::ReadOnlyChanged;
    }
    if (!options.layout.charPaneVisible && m_state.mode == InputMode::CharEntry) {
        input::setInputMode(m_state, InputMode::HexEntry);
    }
    applyLayout();
    m_state.pending |= EditorEvent::RepaintNeeded;
}

const EditOptions& HexEditEngine::options() const { return m_state.options; }

void HexEditEngine::setReadOnly(bool readOnly) {
    if (m_state.options.readOnly == readOnly || m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    m_state.options.readOnly = readOnly;
    m_state.pending |= EditorEvent::ReadOnlyChanged | EditorEvent::RepaintNeeded;
}

bool HexEditEngine::isReadOnly() const { return m_state.options.readOnly; }

void HexEditEngine::setInsertActive(bool active) {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    input::setInsertActive(m_state, active);
}

bool HexEditEngine::isInsertActive() const { return m_state.insertActive; }

void HexEditEngine::setConverter(std::shared_ptr<const ByteCharConverter> converter) {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    if (converter == nullptr) {
        converter = std::make_shared<DefaultByteCharConverter>();
    }
    m_state.converter = std::move(converter);
    m_state.pending |= EditorEvent::RepaintNeeded;
}

const ByteCharConverter& HexEditEngine::converter() const { return *m_state.converter; }

void HexEditEngine::setKeyBindings(const KeyBindings& bindings) { m_bindings = bindings; }

const KeyBindings& HexEditEngine::keyBindings() const { return m_bindings; }

void HexEditEngine::setClipboard(ClipboardAccess* clipboard) {
    m_clipboard = clipboard != nullptr ? clipboard : &m_memoryClipboard;
}

ClipboardAccess& HexEditEngine::clipboard() const { return *m_clipboard; }

void HexEditEngine::setCharSize(const QSize& size) {
    CommandScope scope(*this);
    m_state.geometry.setCharSize(size);
    if (m_hasViewport) {
        m_state.geometry.relayout(m_viewport);
    }
    syncLayout();
}

void HexEditEngine::setViewportRect(const QRect& rect) {
    CommandScope scope(*this);
    m_viewport = rect;
    m_hasViewport = true;
    const bool changed = m_state.geometry.relayout(rect);
    syncLayout(changed);
}

void HexEditEngine::setBytesPerLine(int bytesPerLine) {
    if (bytesPerLine < 1) {
        throw std::invalid_argument("bytesPerLine must be at least 1");
    }
    CommandScope scope(*this);
    m_state.options.layout.bytesPerLine = bytesPerLine;
    m_state.options.layout.fixedBytesPerLine = true;
    applyLayout();
}

void HexEditEngine::setVisibleLines(int visibleLines) {
    CommandScope scope(*this);
    m_state.geometry.setVisibleLines(visibleLines);
    syncLayout();
}

bool HexEditEngine::handleKey(int key, Qt::KeyboardModifiers modifiers, const QString& text) {
    if (m_find.isRunning()) {
        return false;
    }
    CommandScope scope(*this);
    const EditorCommand command = m_bindings.resolve(key, modifiers);
    if (command != EditorCommand::None) {
        return input::execute(m_state, command, m_clipboard);
    }
    const Qt::KeyboardModifiers blocking =
        Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;
    if (!text.isEmpty() && !(modifiers & blocking)) {
        return input::enterCharacter(m_state, text.at(0));
    }
    return false;
}

bool HexEditEngine::executeCommand(EditorCommand command) {
    if (m_find.isRunning()) {
        return false;
    }
    CommandScope scope(*this);
    return input::execute(m_state, command, m_clipboard);
}

void HexEditEngine::pointerPressed(const QPoint& point, bool shift) {
    if (!m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    const GridGeometry& geometry = m_state.geometry;
    if (geometry.hexRect().contains(point)) {
        input::setInputMode(m_state, InputMode::HexEntry);
    } else if (m_state.options.layout.charPaneVisible && geometry.charRect().contains(point)) {
        input::setInputMode(m_state, InputMode::CharEntry);
    } else {
        return;
    }

    int subBytePos = 0;
    const qint64 offset = offsetAt(point, &subBytePos);
    m_pointerDown = true;
    if (shift) {
        m_state.selection.captureAnchor();
        dragSelectTo(offset);
        return;
    }
    input::setPosition(m_state, offset, subBytePos);
    input::releaseSelection(m_state);
    m_state.selection.setAnchor(offset);
    input::scrollCursorIntoView(m_state);
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::pointerMoved(const QPoint& point) {
    if (!m_pointerDown || !m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    dragSelectTo(offsetAt(point, nullptr));
}

void HexEditEngine::pointerReleased(const QPoint& point) {
    Q_UNUSED(point);
    m_pointerDown = false;
}

void HexEditEngine::wheelScrolled(int angleDelta) {
    scrollLines(-(static_cast<qint64>(angleDelta) * kWheelLinesPerNotch / kWheelNotchDelta));
}

void HexEditEngine::scrollLines(qint64 delta) {
    CommandScope scope(*this);
    if (m_state.scroll.scrollLines(delta)) {
        m_state.pending |=
            EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
}

void HexEditEngine::scrollPages(qint64 pages) {
    CommandScope scope(*this);
    if (m_state.scroll.scrollPages(pages)) {
        m_state.pending |=
            EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
}

void HexEditEngine::scrollToLine(qint64 line) {
    CommandScope scope(*this);
    if (m_state.scroll.scrollToLine(line)) {
        m_state.pending |=
            EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
}

void HexEditEngine::scrollByteIntoView(qint64 offset) {
    CommandScope scope(*this);
    input::scrollOffsetIntoView(m_state, offset);
}

void HexEditEngine::setNativeScrollValue(int value) {
    scrollToLine(m_state.scroll.fromNative(value));
}

void HexEditEngine::thumbTrackTo(int value) {
    CommandScope scope(*this);
    if (m_state.scroll.thumbTrackTo(value)) {
        m_state.pending |=
            EditorEvent::ScrollChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
}

void HexEditEngine::select(qint64 start, qint64 length) {
    if (!m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    const qint64 storeLength = m_state.length();
    if (start < 0 || length < 0 || start > storeLength || start + length > storeLength) {
        throw std::out_of_range("selection outside the byte store");
    }
    CommandScope scope(*this);
    input::selectRange(m_state, start, length);
    input::scrollCursorIntoView(m_state);
}

void HexEditEngine::selectAll() {
    if (m_state.hasStore()) {
        select(0, m_state.length());
    }
}

void HexEditEngine::setSelectionStart(qint64 start) {
    if (!m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    const qint64 storeLength = m_state.length();
    if (start < 0 || start > storeLength) {
        throw std::out_of_range("selection start outside the byte store");
    }
    CommandScope scope(*this);
    const qint64 length = qMin(m_state.selection.selectionLength(), storeLength - start);
    input::setPosition(m_state, start, 0);
    m_state.pending |= m_state.selection.setSelectionLength(length);
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::setSelectionLength(qint64 length) {
    if (!m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    if (length < 0 || m_state.selection.selectionStart() + length > m_state.length()) {
        throw std::out_of_range("selection length runs past the byte store");
    }
    CommandScope scope(*this);
    m_state.pending |= m_state.selection.setSelectionLength(length);
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::releaseSelection() {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    input::releaseSelection(m_state);
}

void HexEditEngine::goTo(qint64 offset) {
    if (!m_state.hasStore() || m_find.isRunning()) {
        return;
    }
    if (offset < 0 || offset > m_state.length()) {
        throw std::out_of_range("go-to offset outside the byte store");
    }
    CommandScope scope(*this);
    input::setPosition(m_state, offset, 0);
    input::releaseSelection(m_state);
    input::scrollCursorIntoView(m_state);
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::setInputMode(InputMode mode) {
    if (!m_state.hasStore() || mode == InputMode::Empty || m_find.isRunning()) {
        return;
    }
    if (mode == InputMode::CharEntry && !m_state.options.layout.charPaneVisible) {
        return;
    }
    CommandScope scope(*this);
    input::setInputMode(m_state, mode);
}

std::optional<CopyPayload> HexEditEngine::copy(bool asHex) {
    CommandScope scope(*this);
    return input::copy(m_state, *m_clipboard, asHex);
}

bool HexEditEngine::cut() {
    if (m_find.isRunning()) {
        return false;
    }
    CommandScope scope(*this);
    return input::cut(m_state, *m_clipboard);
}

bool HexEditEngine::paste(bool asHex) {
    if (m_find.isRunning()) {
        return false;
    }
    CommandScope scope(*this);
    return input::paste(m_state, *m_clipboard, asHex);
}

bool HexEditEngine::canCopy() const { return input::canCopy(m_state); }

bool HexEditEngine::canCut() const { return !m_find.isRunning() && input::canCut(m_state); }

bool HexEditEngine::canPaste() const {
    return !m_find.isRunning() && input::canPaste(m_state, *m_clipboard);
}

bool HexEditEngine::canPasteHex() const {
    return !m_find.isRunning() && input::canPasteHex(m_state, *m_clipboard);
}

qint64 HexEditEngine::find(const FindOptions& options) {
    const FindPattern pattern = FindEngine::preparePattern(options, *m_state.converter);
    if (!m_state.hasStore() || m_find.isRunning()) {
        return kFindNotFound;
    }

    const bool forward = options.direction == FindDirection::Forward;
    const qint64 start = m_state.selection.selectionStart() +
                         m_state.selection.selectionLength() * (forward ? 1 : -1);
    // No command scope around the scan: events handled during a yield flush
    // their own notifications.
    const qint64 found = m_find.find(*m_state.store, start, pattern, options.direction);
    CommandScope scope(*this);
    if (found >= 0) {
        input::selectRange(m_state, found, pattern.length());
        input::scrollOffsetIntoView(m_state, found + pattern.length());
        input::scrollOffsetIntoView(m_state, found);
    }
    return found;
}

void HexEditEngine::abortFind() { m_find.abort(); }

bool HexEditEngine::isFindRunning() const { return m_find.isRunning(); }

qint64 HexEditEngine::currentFindingPosition() const { return m_find.currentPosition(); }

void HexEditEngine::commitChanges() {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    m_state.changes.commit();
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::clearDirty() {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    m_state.changes.clearDirty();
    m_state.pending |= EditorEvent::RepaintNeeded;
}

void HexEditEngine::clearCommitted() {
    if (m_find.isRunning()) {
        return;
    }
    CommandScope scope(*this);
    m_state.changes.clearCommitted();
    m_state.pending |= EditorEvent::RepaintNeeded;
}

QVector<qint64> HexEditEngine::changedPositions() const { return m_state.changes.allChanged(); }

const ChangeTracker& HexEditEngine::changes() const { return m_state.changes; }

InputMode HexEditEngine::inputMode() const { return m_state.mode; }

qint64 HexEditEngine::length() const { return m_state.length(); }

qint64 HexEditEngine::selectionStart() const { return m_state.selection.selectionStart(); }

qint64 HexEditEngine::selectionLength() const { return m_state.selection.selectionLength(); }

int HexEditEngine::subBytePos() const { return m_state.selection.subBytePos(); }

qint64 HexEditEngine::currentLine() const { return m_state.selection.currentLine(); }

qint64 HexEditEngine::currentPositionInLine() const {
    return m_state.selection.currentPositionInLine();
}

CellClass HexEditEngine::cellClass(qint64 offset) const {
    if (!m_state.hasStore() || offset < 0 || offset >= m_state.length()) {
        return CellClass::Normal;
    }
    if (m_state.selection.isSelected(offset)) {
        return CellClass::Selected;
    }
    if (m_state.changes.isDirty(offset)) {
        return CellClass::Dirty;
    }
    if (m_state.changes.isCommitted(offset)) {
        return CellClass::Committed;
    }
    if (m_state.store->readByte(offset) == 0) {
        return CellClass::Zero;
    }
    return CellClass::Normal;
}

QRect HexEditEngine::caretRect() const {
    if (!m_state.hasStore() || m_state.mode == InputMode::Empty) {
        return QRect();
    }
    const ScrollController& scroll = m_state.scroll;
    const GridGeometry& geometry = m_state.geometry;
    const qint64 relative = m_state.selection.cursor() - scroll.firstVisibleByte();
    if (relative < 0 || relative >= scroll.visibleBytes()) {
        return QRect();
    }

    const QPoint gridPoint = geometry.gridPointOf(relative);
    const int width = m_state.insertActive ? 1 : geometry.charWidth();
    QPoint origin;
    if (m_state.mode == InputMode::HexEntry) {
        origin = geometry.hexCellOrigin(gridPoint);
        if (m_state.selection.subBytePos() == 1) {
            origin.rx() += geometry.charWidth();
        }
    } else {
        origin = geometry.charCellOrigin(gridPoint);
    }
    return QRect(origin, QSize(width, geometry.charHeight()));
}

VisibleRange HexEditEngine::visibleRange() const {
    if (!m_state.hasStore()) {
        return VisibleRange{};
    }
    return VisibleRange{m_state.scroll.firstVisibleByte(), m_state.scroll.lastVisibleByte()};
}

int HexEditEngine::requiredWidth() const { return m_state.geometry.requiredWidth(); }

QString HexEditEngine::lineInfoText(qint64 absoluteLine) const {
    const qint64 offset =
        absoluteLine * m_state.geometry.bytesPerLine() + m_state.options.lineInfoOffset;
    const QString text = QString::number(offset, 16).rightJustified(
        m_state.geometry.options().lineInfoDigits, QLatin1Char('0'));
    return applyHexCase(text, m_state.options.hexLowerCase);
}

QString HexEditEngine::columnHeaderText(int column) const {
    return applyHexCase(QString::number(column, 16).rightJustified(2, QLatin1Char('0')),
                        m_state.options.hexLowerCase);
}

QString HexEditEngine::hexText(quint8 byte) const {
    return applyHexCase(QStringLiteral("%1").arg(byte, 2, 16, QLatin1Char('0')),
                        m_state.options.hexLowerCase);
}

QRect HexEditEngine::lineInfoRect() const { return m_state.geometry.lineInfoRect(); }

QRect HexEditEngine::columnInfoRect() const { return m_state.geometry.columnInfoRect(); }

QRect HexEditEngine::hexRect() const { return m_state.geometry.hexRect(); }

QRect HexEditEngine::charRect() const { return m_state.geometry.charRect(); }

const GridGeometry& HexEditEngine::geometry() const { return m_state.geometry; }

const ScrollController& HexEditEngine::scroll() const { return m_state.scroll; }

const EditorState& HexEditEngine::state() const { return m_state; }

void HexEditEngine::onStoreLengthChanged() {
    if (m_find.isRunning()) {
        // The scan bounds are stale; stop before it reads past the new end.
        m_find.abort();
    }
    if (m_commandDepth > 0) {
        // The running command adjusts cursor and scroll bounds itself.
        m_state.pending |= EditorEvent::ContentChanged | EditorEvent::RepaintNeeded;
        return;
    }
    CommandScope scope(*this);
    const qint64 length = m_state.length();
    if (m_state.selection.cursor() > length) {
        input::setPosition(m_state, length, 0);
    }
    if (m_state.selection.selectionEnd() > length) {
        m_state.pending |= m_state.selection.setSelectionLength(
            qMax<qint64>(0, length - m_state.selection.cursor()));
    }
    input::refreshScrollBounds(m_state);
    m_state.pending |= EditorEvent::ContentChanged | EditorEvent::RepaintNeeded;
}

void HexEditEngine::onStoreContentChanged() {
    CommandScope scope(*this);
    m_state.pending |= EditorEvent::ContentChanged | EditorEvent::RepaintNeeded;
}

void HexEditEngine::applyLayout() {
    m_state.geometry.setOptions(m_state.options.layout);
    if (m_hasViewport) {
        m_state.geometry.relayout(m_viewport);
    }
    syncLayout();
}

void HexEditEngine::syncLayout(bool layoutChanged) {
    const GridGeometry& geometry = m_state.geometry;
    m_state.scroll.setBytesPerLine(geometry.bytesPerLine());
    m_state.scroll.setVisibleLines(geometry.visibleLines());
    m_state.pending |= m_state.selection.setBytesPerLine(geometry.bytesPerLine());
    input::refreshScrollBounds(m_state);
    if (layoutChanged) {
        m_state.pending |=
            EditorEvent::LayoutChanged | EditorEvent::RepaintNeeded | EditorEvent::CaretChanged;
    }
    if (geometry.requiredWidth() != m_lastRequiredWidth) {
        m_lastRequiredWidth = geometry.requiredWidth();
        m_state.pending |= EditorEvent::RequiredWidthChanged;
    }
}

qint64 HexEditEngine::offsetAt(const QPoint& point, int* subBytePos) const {
    const qint64 first = m_state.scroll.firstVisibleByte();
    const qint64 length = m_state.length();
    if (m_state.mode == InputMode::CharEntry) {
        if (subBytePos != nullptr) {
            *subBytePos = 0;
        }
        return m_state.geometry.charPositionAt(point, first, length);
    }
    const BytePosition position = m_state.geometry.hexPositionAt(point, first, length);
    if (subBytePos != nullptr) {
        *subBytePos = position.subBytePos;
    }
    return position.offset;
}

void HexEditEngine::dragSelectTo(qint64 offset) {
    SelectionModel& selection = m_state.selection;
    const qint64 anchor = selection.anchor();
    const qint64 start = qMin(anchor, offset);
    const qint64 length = qAbs(offset - anchor);
    if (start == selection.cursor() && length == selection.selectionLength()) {
        return;
    }
    m_state.pending |= selection.setCursor(start, 0);
    m_state.pending |= selection.setSelectionLength(length);
    m_state.pending |= EditorEvent::RepaintNeeded;
    input::scrollOffsetIntoView(m_state, offset);
}

void HexEditEngine::flushPending() {
    if (m_flushing) {
        return;
    }
    m_flushing = true;
    while (m_state.pending.toInt() != 0) {
        const EditorEvents events = m_state.pending;
        m_state.pending = {};

        if (events.testFlag(EditorEvent::ByteStoreChanged)) {
            emit byteStoreChanged();
        }
        if (events.testFlag(EditorEvent::ContentChanged)) {
            emit contentChanged();
        }
        if (events.testFlag(EditorEvent::ReadOnlyChanged)) {
            emit readOnlyChanged(m_state.options.readOnly);
        }
        if (events.testFlag(EditorEvent::InputModeChanged)) {
            emit inputModeChanged();
        }
        if (events.testFlag(EditorEvent::InsertActiveChanged)) {
            emit insertActiveChanged(m_state.insertActive);
        }
        if (events.testFlag(EditorEvent::SelectionStartChanged)) {
            emit selectionStartChanged(m_state.selection.selectionStart());
        }
        if (events.testFlag(EditorEvent::SelectionLengthChanged)) {
            emit selectionLengthChanged(m_state.selection.selectionLength());
        }
        if (events.testFlag(EditorEvent::CurrentLineChanged)) {
            emit currentLineChanged(m_state.selection.currentLine());
        }
        if (events.testFlag(EditorEvent::CurrentPositionInLineChanged)) {
            emit currentPositionInLineChanged(m_state.selection.currentPositionInLine());
        }
        if (events.testFlag(EditorEvent::LayoutChanged)) {
            emit layoutChanged();
        }
        if (events.testFlag(EditorEvent::RequiredWidthChanged)) {
            emit requiredWidthChanged(m_state.geometry.requiredWidth());
        }
        if (events.testFlag(EditorEvent::ScrollChanged)) {
            emit scrollChanged();
        }
        if (events.testFlag(EditorEvent::Copied)) {
            emit copied();
        }
        if (events.testFlag(EditorEvent::FocusNextRequested)) {
            emit focusTraversalRequested(true);
        }
        if (events.testFlag(EditorEvent::FocusPreviousRequested)) {
            emit focusTraversalRequested(false);
        }
        if (events.testFlag(EditorEvent::CaretChanged)) {
            emit caretChanged();
        }
        if (events.testFlag(EditorEvent::RepaintNeeded)) {
            emit repaintRequested();
        }
    }
    m_flushing = false;
}

}  // namespace hexgrid
