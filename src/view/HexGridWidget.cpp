#include "view/HexGridWidget.h"

#include <QEvent>
#include <QFocusEvent>
#include <QFontDatabase>
#include <QFontMetrics>
#include <QPainter>
#include <QStyle>

namespace hexgrid {

namespace {
constexpr int kShadowSelectionAlpha = 70;
constexpr int kOverwriteCaretAlpha = 110;
}  // namespace

HexGridWidget::HexGridWidget(QWidget* parent) : QWidget(parent) {
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_InputMethodEnabled, false);
    setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));

    m_engine = new HexEditEngine(this);
    m_engine->setClipboard(&m_clipboard);

    m_contentWidget = new QWidget(this);
    m_contentWidget->setAutoFillBackground(false);
    m_contentWidget->setMouseTracking(false);
    m_contentWidget->installEventFilter(this);
    m_vScrollBar = new QScrollBar(Qt::Vertical, this);

    connect(m_engine, &HexEditEngine::repaintRequested, m_contentWidget,
            qOverload<>(&QWidget::update));
    connect(m_engine, &HexEditEngine::caretChanged, m_contentWidget,
            qOverload<>(&QWidget::update));
    connect(m_engine, &HexEditEngine::scrollChanged, this, &HexGridWidget::syncScrollBar);
    connect(m_engine, &HexEditEngine::layoutChanged, this, &HexGridWidget::syncScrollBar);
    connect(m_engine, &HexEditEngine::byteStoreChanged, this, &HexGridWidget::syncScrollBar);
    connect(m_engine, &HexEditEngine::requiredWidthChanged, this,
            [this]() { updateGeometry(); });
    connect(m_engine, &HexEditEngine::focusTraversalRequested, this,
            [this](bool forward) { focusNextPrevChild(forward); });

    connect(m_vScrollBar, &QScrollBar::actionTriggered, this, [this](int action) {
        switch (action) {
            case QAbstractSlider::SliderSingleStepAdd:
                m_engine->scrollLines(1);
                break;
            case QAbstractSlider::SliderSingleStepSub:
                m_engine->scrollLines(-1);
                break;
            case QAbstractSlider::SliderPageStepAdd:
                m_engine->scrollPages(1);
                break;
            case QAbstractSlider::SliderPageStepSub:
                m_engine->scrollPages(-1);
                break;
            default:
                return;
        }
        m_vScrollBar->setSliderPosition(m_engine->scroll().nativeValue());
    });
    connect(m_vScrollBar, &QScrollBar::valueChanged, this, [this](int value) {
        if (m_syncingScrollBar || value == m_engine->scroll().nativeValue()) {
            return;
        }
        if (m_vScrollBar->isSliderDown()) {
            m_engine->thumbTrackTo(value);
        } else {
            m_engine->setNativeScrollValue(value);
        }
    });

    applyFontMetrics();
    layoutChildren();
    syncScrollBar();
}

HexEditEngine& HexGridWidget::engine() { return *m_engine; }

const HexEditEngine& HexGridWidget::engine() const { return *m_engine; }

void HexGridWidget::setGroupSeparatorVisible(bool visible) {
    if (m_groupSeparatorVisible == visible) {
        return;
    }
    m_groupSeparatorVisible = visible;
    m_contentWidget->update();
}

bool HexGridWidget::groupSeparatorVisible() const { return m_groupSeparatorVisible; }

QSize HexGridWidget::sizeHint() const {
    const int scrollW = style()->pixelMetric(QStyle::PM_ScrollBarExtent);
    const int lineH = m_engine->geometry().charHeight();
    return QSize(m_engine->requiredWidth() + scrollW, lineH * 24);
}

bool HexGridWidget::event(QEvent* event) {
    // Bound keys and plain typing win over window shortcuts such as Ctrl+C.
    if (event->type() == QEvent::ShortcutOverride && m_engine->byteStore() != nullptr) {
        auto* keyEvent = static_cast<QKeyEvent*>(event);
        const Qt::KeyboardModifiers blocking =
            Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;
        const bool bound =
            m_engine->keyBindings().resolve(keyEvent->key(), keyEvent->modifiers()) !=
            EditorCommand::None;
        const bool typing = !keyEvent->text().isEmpty() && !(keyEvent->modifiers() & blocking);
        if (bound || typing) {
            keyEvent->accept();
            return true;
        }
    }
    // Tab and Backtab would otherwise be eaten by focus traversal before
    // keyPressEvent sees them.
    if (event->type() == QEvent::KeyPress) {
        auto* keyEvent = static_cast<QKeyEvent*>(event);
        if (keyEvent->key() == Qt::Key_Tab || keyEvent->key() == Qt::Key_Backtab) {
            if (m_engine->handleKey(keyEvent->key(), keyEvent->modifiers(), QString())) {
                keyEvent->accept();
                return true;
            }
        }
    }
    return QWidget::event(event);
}

void HexGridWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    layoutChildren();
}

bool HexGridWidget::eventFilter(QObject* watched, QEvent* event) {
    if (watched != m_contentWidget) {
        return QWidget::eventFilter(watched, event);
    }

    switch (event->type()) {
        case QEvent::Paint:
            paintContent();
            return true;
        case QEvent::MouseButtonPress:
        case QEvent::MouseButtonDblClick: {
            auto* mouseEvent = static_cast<QMouseEvent*>(event);
            if (mouseEvent->button() != Qt::LeftButton) {
                return false;
            }
            setFocus(Qt::MouseFocusReason);
            m_engine->pointerPressed(mouseEvent->position().toPoint(),
                                     mouseEvent->modifiers().testFlag(Qt::ShiftModifier));
            mouseEvent->accept();
            return true;
        }
        case QEvent::MouseMove: {
            auto* mouseEvent = static_cast<QMouseEvent*>(event);
            if (mouseEvent->buttons() & Qt::LeftButton) {
                m_engine->pointerMoved(mouseEvent->position().toPoint());
                mouseEvent->accept();
                return true;
            }
            return false;
        }
        case QEvent::MouseButtonRelease: {
            auto* mouseEvent = static_cast<QMouseEvent*>(event);
            if (mouseEvent->button() == Qt::LeftButton) {
                m_engine->pointerReleased(mouseEvent->position().toPoint());
                mouseEvent->accept();
                return true;
            }
            return false;
        }
        default:
            break;
    }
    return QWidget::eventFilter(watched, event);
}

void HexGridWidget::keyPressEvent(QKeyEvent* event) {
    if (m_engine->handleKey(event->key(), event->modifiers(), event->text())) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}

void HexGridWidget::wheelEvent(QWheelEvent* event) {
    const int delta = event->angleDelta().y();
    if (delta == 0) {
        QWidget::wheelEvent(event);
        return;
    }
    m_engine->wheelScrolled(delta);
    event->accept();
}

void HexGridWidget::focusInEvent(QFocusEvent* event) {
    QWidget::focusInEvent(event);
    m_contentWidget->update();
}

void HexGridWidget::focusOutEvent(QFocusEvent* event) {
    QWidget::focusOutEvent(event);
    m_contentWidget->update();
}

void HexGridWidget::changeEvent(QEvent* event) {
    if (event->type() == QEvent::FontChange) {
        applyFontMetrics();
    }
    QWidget::changeEvent(event);
}

void HexGridWidget::applyFontMetrics() {
    const QFontMetrics fm(font());
    m_engine->setCharSize(QSize(fm.horizontalAdvance(QLatin1Char('0')), fm.height()));
    m_vScrollBar->setSingleStep(1);
}

void HexGridWidget::layoutChildren() {
    const int scrollW = style()->pixelMetric(QStyle::PM_ScrollBarExtent);
    const int contentW = qMax(0, width() - scrollW);
    m_contentWidget->setGeometry(0, 0, contentW, height());
    m_vScrollBar->setGeometry(contentW, 0, scrollW, height());
    m_engine->setViewportRect(QRect(QPoint(0, 0), m_contentWidget->size()));
}

void HexGridWidget::syncScrollBar() {
    const ScrollController& scroll = m_engine->scroll();
    m_syncingScrollBar = true;
    m_vScrollBar->setRange(0, scroll.nativeMaximum());
    m_vScrollBar->setPageStep(qMax(1, scroll.visibleLines()));
    m_vScrollBar->setValue(scroll.nativeValue());
    m_vScrollBar->setEnabled(m_engine->byteStore() != nullptr && scroll.nativeMaximum() > 0);
    m_syncingScrollBar = false;
}

void HexGridWidget::paintContent() {
    QPainter painter(m_contentWidget);
    painter.fillRect(m_contentWidget->rect(), palette().base());
    painter.setFont(font());
    if (m_engine->byteStore() == nullptr) {
        return;
    }

    const ScrollController& scroll = m_engine->scroll();
    paintLineInfo(painter, scroll.scrollPos(), m_engine->geometry().visibleLines());
    paintColumnHeader(painter);
    paintGroupSeparators(painter);
    paintBytes(painter);
    paintCaret(painter);
}

void HexGridWidget::paintLineInfo(QPainter& painter, qint64 firstLine, int lineCount) {
    const GridLayoutOptions& layout = m_engine->options().layout;
    if (!layout.lineInfoVisible) {
        return;
    }
    const GridGeometry& geometry = m_engine->geometry();
    const QRect infoRect = geometry.lineInfoRect();
    const int lineH = geometry.charHeight();
    const qint64 bytesPerLine = geometry.bytesPerLine();
    const qint64 length = m_engine->length();

    painter.fillRect(infoRect, palette().alternateBase());
    painter.setPen(palette().placeholderText().color());
    for (int i = 0; i < lineCount; ++i) {
        const qint64 line = firstLine + i;
        // The row holding the append position is still labelled.
        if (line * bytesPerLine > length) {
            break;
        }
        const QRect rowRect(infoRect.x(), geometry.hexRect().y() + i * lineH, infoRect.width(),
                            lineH);
        painter.drawText(rowRect, Qt::AlignLeft | Qt::AlignVCenter,
                         m_engine->lineInfoText(line));
    }
}

void HexGridWidget::paintColumnHeader(QPainter& painter) {
    if (!m_engine->options().layout.columnInfoVisible) {
        return;
    }
    const GridGeometry& geometry = m_engine->geometry();
    const int cw = geometry.charWidth();
    const int lineH = geometry.charHeight();
    const int currentColumn = static_cast<int>(m_engine->currentPositionInLine()) - 1;

    for (int column = 0; column < geometry.bytesPerLine(); ++column) {
        const QPoint origin = geometry.columnHeaderOrigin(column);
        const QRect cellRect(origin, QSize(2 * cw, lineH));
        painter.setPen(column == currentColumn ? palette().text().color()
                                               : palette().placeholderText().color());
        painter.drawText(cellRect, Qt::AlignLeft | Qt::AlignVCenter,
                         m_engine->columnHeaderText(column));
    }
}

void HexGridWidget::paintGroupSeparators(QPainter& painter) {
    const GridGeometry& geometry = m_engine->geometry();
    if (!m_groupSeparatorVisible || !geometry.isGrouped()) {
        return;
    }
    const QRect hexRect = geometry.hexRect();
    const QRect columnRect = geometry.columnInfoRect();
    const int top = m_engine->options().layout.columnInfoVisible ? columnRect.y() : hexRect.y();
    const int cw = geometry.charWidth();

    painter.setPen(palette().mid().color());
    for (int column = geometry.groupSize(); column < geometry.bytesPerLine();
         column += geometry.groupSize()) {
        const int x = geometry.hexCellOrigin(QPoint(column, 0)).x() - cw;
        painter.drawLine(x, top, x, hexRect.bottom());
    }
}

qint64 HexGridWidget::paintedByteCount() const {
    const VisibleRange range = m_engine->visibleRange();
    if (range.last < range.first) {
        return 0;
    }
    // visibleRange() also covers the first byte of the row below the grid.
    return qMin(range.last - range.first + 1, m_engine->geometry().visibleBytes());
}

void HexGridWidget::paintBytes(QPainter& painter) {
    const GridGeometry& geometry = m_engine->geometry();
    const qint64 count = paintedByteCount();
    if (count <= 0) {
        return;
    }
    const qint64 first = m_engine->visibleRange().first;
    const QByteArray bytes = m_engine->byteStore()->readRange(first, count);
    const bool charPane = m_engine->options().layout.charPaneVisible;
    const QString chars = charPane ? m_engine->converter().bytesToDisplayString(bytes) : QString();

    const int cw = geometry.charWidth();
    const int lineH = geometry.charHeight();
    const bool hexActive = m_engine->inputMode() == InputMode::HexEntry;
    const QColor highlight = palette().highlight().color();
    QColor shadow = highlight;
    shadow.setAlpha(kShadowSelectionAlpha);

    for (int i = 0; i < bytes.size(); ++i) {
        const qint64 offset = first + i;
        const QPoint gridPoint = geometry.gridPointOf(i);
        const CellClass cls = m_engine->cellClass(offset);
        const bool selected = cls == CellClass::Selected;
        const quint8 value = static_cast<quint8>(bytes.at(i));

        const QPoint hexOrigin = geometry.hexCellOrigin(gridPoint);
        int hexWidth = 2 * cw;
        const bool nextSelected = i + 1 < bytes.size() && gridPoint.x() + 1 < geometry.bytesPerLine() &&
                                  m_engine->cellClass(offset + 1) == CellClass::Selected;
        if (selected && nextSelected) {
            hexWidth = geometry.hexCellOrigin(QPoint(gridPoint.x() + 1, gridPoint.y())).x() -
                       hexOrigin.x();
        }
        const QRect hexCell(hexOrigin, QSize(hexWidth, lineH));
        if (selected) {
            painter.fillRect(hexCell, hexActive ? highlight : shadow);
        }
        painter.setPen(selected && hexActive ? palette().highlightedText().color()
                                             : foregroundFor(cls));
        painter.drawText(QRect(hexOrigin, QSize(2 * cw, lineH)), Qt::AlignLeft | Qt::AlignVCenter,
                         m_engine->hexText(value));

        if (!charPane) {
            continue;
        }
        const QRect charCell(geometry.charCellOrigin(gridPoint), QSize(cw, lineH));
        if (selected) {
            painter.fillRect(charCell, hexActive ? shadow : highlight);
        }
        painter.setPen(selected && !hexActive ? palette().highlightedText().color()
                                              : foregroundFor(cls));
        painter.drawText(charCell, Qt::AlignLeft | Qt::AlignVCenter, QString(chars.at(i)));
    }
}

void HexGridWidget::paintCaret(QPainter& painter) {
    if (!hasFocus()) {
        return;
    }
    const QRect caret = m_engine->caretRect();
    if (caret.isNull()) {
        return;
    }
    if (m_engine->isInsertActive()) {
        painter.fillRect(caret, palette().text());
        return;
    }
    QColor block = palette().text().color();
    block.setAlpha(kOverwriteCaretAlpha);
    painter.fillRect(caret, block);
}

QColor HexGridWidget::foregroundFor(CellClass cls) const {
    switch (cls) {
        case CellClass::Zero:
            return QColor(150, 150, 150);
        case CellClass::Dirty:
            return QColor(0xD0, 0x20, 0x20);
        case CellClass::Committed:
            return QColor(0x10, 0x60, 0xC0);
        case CellClass::Selected:
        case CellClass::Normal:
        default:
            return palette().text().color();
    }
}

}  // namespace hexgrid
