#pragma once

#include <memory>
#include <optional>

#include <QObject>
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>
#include <QVector>

#include "edit/ClipboardCodec.h"
#include "edit/EditorState.h"
#include "edit/KeyBindings.h"
#include "find/FindEngine.h"

namespace hexgrid {

enum class CellClass {
    Normal = 0,
    Zero,
    Dirty,
    Committed,
    Selected,
};

struct VisibleRange {
    qint64 first = 0;
    qint64 last = -1;
};

// Host-facing editor: owns the editor state, turns key/pointer/scroll input
// into commands and emits change signals once each call has completed.
class HexEditEngine : public QObject {
    Q_OBJECT

public:
    explicit HexEditEngine(QObject* parent = nullptr);
    ~HexEditEngine() override;

    // Store is owned by the caller and must outlive the binding. While a find
    // is running the swap is refused, the find is aborted and false returned.
    bool setByteStore(ByteStore* store);
    ByteStore* byteStore() const;

    void setOptions(const EditOptions& options);
    const EditOptions& options() const;
    void setReadOnly(bool readOnly);
    bool isReadOnly() const;
    void setInsertActive(bool active);
    bool isInsertActive() const;
    void setConverter(std::shared_ptr<const ByteCharConverter> converter);
    const ByteCharConverter& converter() const;
    void setKeyBindings(const KeyBindings& bindings);
    const KeyBindings& keyBindings() const;
    // nullptr restores the built-in in-memory clipboard.
    void setClipboard(ClipboardAccess* clipboard);
    ClipboardAccess& clipboard() const;

    void setCharSize(const QSize& size);
    void setViewportRect(const QRect& rect);
    void setBytesPerLine(int bytesPerLine);
    void setVisibleLines(int visibleLines);

    bool handleKey(int key, Qt::KeyboardModifiers modifiers, const QString& text);
    bool executeCommand(EditorCommand command);
    void pointerPressed(const QPoint& point, bool shift);
    void pointerMoved(const QPoint& point);
    void pointerReleased(const QPoint& point);
    void wheelScrolled(int angleDelta);

    void scrollLines(qint64 delta);
    void scrollPages(qint64 pages);
    void scrollToLine(qint64 line);
    void scrollByteIntoView(qint64 offset);
    void setNativeScrollValue(int value);
    void thumbTrackTo(int value);

    // Out-of-range arguments throw std::out_of_range. Calls that change the
    // selection, options or store content are ignored while a find runs.
    void select(qint64 start, qint64 length);
    void selectAll();
    void setSelectionStart(qint64 start);
    void setSelectionLength(qint64 length);
    void releaseSelection();
    void goTo(qint64 offset);
    void setInputMode(InputMode mode);

    std::optional<CopyPayload> copy(bool asHex);
    bool cut();
    bool paste(bool asHex);
    bool canCopy() const;
    bool canCut() const;
    bool canPaste() const;
    bool canPasteHex() const;

    // Throws std::invalid_argument for an unusable pattern. On a match the
    // match is selected and scrolled into view.
    qint64 find(const FindOptions& options);
    void abortFind();
    bool isFindRunning() const;
    qint64 currentFindingPosition() const;

    void commitChanges();
    void clearDirty();
    void clearCommitted();
    QVector<qint64> changedPositions() const;
    const ChangeTracker& changes() const;

    InputMode inputMode() const;
    qint64 length() const;
    qint64 selectionStart() const;
    qint64 selectionLength() const;
    int subBytePos() const;
    qint64 currentLine() const;
    qint64 currentPositionInLine() const;

    CellClass cellClass(qint64 offset) const;
    QRect caretRect() const;
    VisibleRange visibleRange() const;
    int requiredWidth() const;
    QString lineInfoText(qint64 absoluteLine) const;
    QString columnHeaderText(int column) const;
    QString hexText(quint8 byte) const;
    QRect lineInfoRect() const;
    QRect columnInfoRect() const;
    QRect hexRect() const;
    QRect charRect() const;
    const GridGeometry& geometry() const;
    const ScrollController& scroll() const;
    const EditorState& state() const;

signals:
    void byteStoreChanged();
    void contentChanged();
    void selectionStartChanged(qint64 start);
    void selectionLengthChanged(qint64 length);
    void currentLineChanged(qint64 line);
    void currentPositionInLineChanged(qint64 position);
    void insertActiveChanged(bool active);
    void readOnlyChanged(bool readOnly);
    void inputModeChanged();
    void scrollChanged();
    void layoutChanged();
    void requiredWidthChanged(int width);
    void caretChanged();
    void copied();
    void repaintRequested();
    void focusTraversalRequested(bool forward);

private:
    class CommandScope;
    friend class CommandScope;

    void onStoreLengthChanged();
    void onStoreContentChanged();
    void applyLayout();
    void syncLayout(bool layoutChanged = true);
    qint64 offsetAt(const QPoint& point, int* subBytePos) const;
    void dragSelectTo(qint64 offset);
    void flushPending();

    EditorState m_state;
    KeyBindings m_bindings;
    FindEngine m_find;
    MemoryClipboard m_memoryClipboard;
    ClipboardAccess* m_clipboard = nullptr;
    QRect m_viewport;
    bool m_hasViewport = false;
    bool m_pointerDown = false;
    int m_commandDepth = 0;
    bool m_flushing = false;
    int m_lastRequiredWidth = 0;
};

}  // namespace hexgrid
