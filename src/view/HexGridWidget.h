#pragma once

#include <QKeyEvent>
#include <QMouseEvent>
#include <QScrollBar>
#include <QWheelEvent>
#include <QWidget>

#include "engine/HexEditEngine.h"
#include "view/SystemClipboard.h"

namespace hexgrid {

// Paints a HexEditEngine and feeds it keyboard, pointer and scroll input.
class HexGridWidget : public QWidget {
    Q_OBJECT

public:
    explicit HexGridWidget(QWidget* parent = nullptr);

    HexEditEngine& engine();
    const HexEditEngine& engine() const;

    void setGroupSeparatorVisible(bool visible);
    bool groupSeparatorVisible() const;

    QSize sizeHint() const override;

protected:
    bool event(QEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void focusInEvent(QFocusEvent* event) override;
    void focusOutEvent(QFocusEvent* event) override;
    void changeEvent(QEvent* event) override;

private:
    void applyFontMetrics();
    void layoutChildren();
    void syncScrollBar();
    void paintContent();
    void paintLineInfo(QPainter& painter, qint64 firstLine, int lineCount);
    void paintColumnHeader(QPainter& painter);
    void paintGroupSeparators(QPainter& painter);
    void paintBytes(QPainter& painter);
    // Bytes drawn from visibleRange().first; never more than the grid holds.
    qint64 paintedByteCount() const;
    void paintCaret(QPainter& painter);
    QColor foregroundFor(CellClass cls) const;

    HexEditEngine* m_engine = nullptr;
    SystemClipboard m_clipboard;
    QWidget* m_contentWidget = nullptr;
    QScrollBar* m_vScrollBar = nullptr;
    bool m_groupSeparatorVisible = true;
    bool m_syncingScrollBar = false;
};

}  // namespace hexgrid
