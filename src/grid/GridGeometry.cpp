#include "grid/GridGeometry.h"

#include <stdexcept>

#include "debug/EditTrace.h"

namespace hexgrid {

namespace {
constexpr int kDefaultCharWidth = 8;
constexpr int kDefaultCharHeight = 16;
}  // namespace

GridGeometry::GridGeometry() : m_charSize(kDefaultCharWidth, kDefaultCharHeight) {
    m_hexRect = QRect(kMarginLeft, 0, hexPaneWidth(), m_charSize.height());
}

void GridGeometry::setCharSize(const QSize& size) {
    m_charSize = QSize(qMax(1, size.width()), qMax(1, size.height()));
}

QSize GridGeometry::charSize() const { return m_charSize; }

int GridGeometry::charWidth() const { return m_charSize.width(); }

int GridGeometry::charHeight() const { return m_charSize.height(); }

void GridGeometry::setOptions(const GridLayoutOptions& options) {
    if (options.bytesPerLine < 1) {
        throw std::invalid_argument("bytesPerLine must be at least 1");
    }
    m_options = options;
    m_options.groupSize = qMax(1, m_options.groupSize);
    m_options.lineInfoDigits =
        qBound(kMinLineInfoDigits, m_options.lineInfoDigits, kMaxLineInfoDigits);
    if (m_options.fixedBytesPerLine) {
        m_bytesPerLine = m_options.bytesPerLine;
    }
}

const GridLayoutOptions& GridGeometry::options() const { return m_options; }

bool GridGeometry::relayout(const QRect& contentRect) {
    const int cw = charWidth();
    const int ch = charHeight();
    const int oldBytesPerLine = m_bytesPerLine;
    const int oldVisibleLines = m_visibleLines;
    const QRect oldHexRect = m_hexRect;
    const QRect oldCharRect = m_charRect;

    int requiredWidth = 0;
    if (m_options.lineInfoVisible) {
        m_lineInfoRect = QRect(contentRect.x() + kMarginLeft, contentRect.y(),
                               cw * m_options.lineInfoDigits, contentRect.height());
    } else {
        m_lineInfoRect = QRect(contentRect.x() + kMarginLeft, contentRect.y(), 0,
                               contentRect.height());
    }
    requiredWidth += kMarginLeft + m_lineInfoRect.width();

    const int columnInfoHeight = m_options.columnInfoVisible ? ch + kColumnInfoPadding : 0;
    const int paneX = m_lineInfoRect.x() + m_lineInfoRect.width() + (m_options.lineInfoVisible ? cw : 0);
    m_columnInfoRect = QRect(paneX, contentRect.y(), qMax(0, contentRect.right() + 1 - paneX),
                             columnInfoHeight);
    if (m_options.columnInfoVisible) {
        m_lineInfoRect.setTop(m_lineInfoRect.top() + columnInfoHeight);
    }

    if (m_options.fixedBytesPerLine) {
        m_bytesPerLine = m_options.bytesPerLine;
    } else {
        m_bytesPerLine = fitBytesPerLine(contentRect.right() + 1 - paneX);
    }

    m_hexRect = QRect(paneX, contentRect.y() + columnInfoHeight, hexPaneWidth(),
                      qMax(0, contentRect.height() - columnInfoHeight));
    requiredWidth += (paneX - m_lineInfoRect.x() - m_lineInfoRect.width()) + m_hexRect.width();

    if (m_options.charPaneVisible) {
        m_charRect = QRect(m_hexRect.x() + m_hexRect.width(), m_hexRect.y(), cw * m_bytesPerLine,
                           m_hexRect.height());
        requiredWidth += m_charRect.width();
    } else {
        m_charRect = QRect();
    }
    m_requiredWidth = requiredWidth;
    m_visibleLines = qMax(1, m_hexRect.height() / ch);

    const bool changed = oldBytesPerLine != m_bytesPerLine || oldVisibleLines != m_visibleLines ||
                         oldHexRect != m_hexRect || oldCharRect != m_charRect;
    if (changed && debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("GridGeometry::relayout: bytesPerLine=%1 visibleLines=%2 "
                                         "hex=%3,%4 %5x%6 requiredWidth=%7")
                              .arg(m_bytesPerLine)
                              .arg(m_visibleLines)
                              .arg(m_hexRect.x())
                              .arg(m_hexRect.y())
                              .arg(m_hexRect.width())
                              .arg(m_hexRect.height())
                              .arg(m_requiredWidth));
    }
    return changed;
}

void GridGeometry::setBytesPerLine(int bytesPerLine) {
    if (bytesPerLine < 1) {
        throw std::invalid_argument("bytesPerLine must be at least 1");
    }
    m_bytesPerLine = bytesPerLine;
    m_options.bytesPerLine = bytesPerLine;
    m_hexRect.setWidth(hexPaneWidth());
    if (m_options.charPaneVisible) {
        m_charRect = QRect(m_hexRect.x() + m_hexRect.width(), m_hexRect.y(),
                           charWidth() * m_bytesPerLine, m_hexRect.height());
    }
}

void GridGeometry::setVisibleLines(int visibleLines) { m_visibleLines = qMax(1, visibleLines); }

int GridGeometry::bytesPerLine() const { return m_bytesPerLine; }

int GridGeometry::groupSize() const { return m_options.groupSize; }

bool GridGeometry::isGrouped() const { return m_options.groupSize > 1; }

int GridGeometry::visibleLines() const { return m_visibleLines; }

qint64 GridGeometry::visibleBytes() const {
    return static_cast<qint64>(m_bytesPerLine) * static_cast<qint64>(m_visibleLines);
}

QRect GridGeometry::lineInfoRect() const { return m_lineInfoRect; }

QRect GridGeometry::columnInfoRect() const { return m_columnInfoRect; }

QRect GridGeometry::hexRect() const { return m_hexRect; }

QRect GridGeometry::charRect() const { return m_charRect; }

int GridGeometry::requiredWidth() const { return m_requiredWidth; }

int GridGeometry::hexPaneWidth() const {
    return charWidth() * (m_bytesPerLine * kHexCellChars + gapsBefore(m_bytesPerLine - 1) + 1);
}

QPoint GridGeometry::gridPointOf(qint64 relativeOffset) const {
    qint64 row = relativeOffset / m_bytesPerLine;
    qint64 column = relativeOffset - row * m_bytesPerLine;
    if (column < 0) {
        column += m_bytesPerLine;
        --row;
    }
    return QPoint(static_cast<int>(column), static_cast<int>(row));
}

QPoint GridGeometry::hexCellOrigin(const QPoint& gridPoint) const {
    const int cw = charWidth();
    const int x = m_hexRect.x() + gridPoint.x() * kHexCellChars * cw + gapsBefore(gridPoint.x()) * cw;
    const int y = m_hexRect.y() + gridPoint.y() * charHeight();
    return QPoint(x, y);
}

QPoint GridGeometry::charCellOrigin(const QPoint& gridPoint) const {
    return QPoint(m_charRect.x() + gridPoint.x() * charWidth(),
                  m_charRect.y() + gridPoint.y() * charHeight());
}

QPoint GridGeometry::columnHeaderOrigin(int column) const {
    const int cw = charWidth();
    return QPoint(m_columnInfoRect.x() + column * kHexCellChars * cw + gapsBefore(column) * cw,
                  m_columnInfoRect.y());
}

BytePosition GridGeometry::hexPositionAt(const QPoint& pixel, qint64 firstVisibleByte,
                                         qint64 length) const {
    const int cw = charWidth();
    const int cellWidth = kHexCellChars * cw;
    const int rx = qMax(0, pixel.x() - m_hexRect.x());
    const int ry = qMax(0, pixel.y() - m_hexRect.y());

    int column = 0;
    int subBytePos = 0;
    if (isGrouped()) {
        const int groupWidth = m_options.groupSize * cellWidth;
        const int groupSpan = groupWidth + cw;
        const int group = rx / groupSpan;
        const int within = rx % groupSpan;
        if (within >= groupWidth) {
            // Inside the gap: resolve to the first column of the next group.
            column = (group + 1) * m_options.groupSize;
            subBytePos = 0;
        } else {
            column = group * m_options.groupSize + within / cellWidth;
            subBytePos = qMin(1, (within % cellWidth) / cw);
        }
    } else {
        column = rx / cellWidth;
        subBytePos = qMin(1, (rx % cellWidth) / cw);
    }
    if (column >= m_bytesPerLine) {
        column = m_bytesPerLine - 1;
        subBytePos = 1;
    }

    const qint64 row = ry / charHeight();
    const qint64 offset = firstVisibleByte + row * m_bytesPerLine + column;
    if (offset < 0) {
        return BytePosition{0, 0};
    }
    if (offset >= length) {
        return BytePosition{qMax<qint64>(0, length), 0};
    }
    return BytePosition{offset, subBytePos};
}

qint64 GridGeometry::charPositionAt(const QPoint& pixel, qint64 firstVisibleByte,
                                    qint64 length) const {
    const int rx = qMax(0, pixel.x() - m_charRect.x());
    const int ry = qMax(0, pixel.y() - m_charRect.y());
    const int column = qMin(m_bytesPerLine - 1, rx / charWidth());
    const qint64 row = ry / charHeight();
    const qint64 offset = firstVisibleByte + row * m_bytesPerLine + column;
    if (offset < 0) {
        return 0;
    }
    return qMin(qMax<qint64>(0, length), offset);
}

int GridGeometry::gapsBefore(int column) const {
    if (!isGrouped() || column <= 0) {
        return 0;
    }
    return column / m_options.groupSize;
}

int GridGeometry::fitBytesPerLine(int availableWidth) const {
    const int chars = availableWidth / charWidth();
    int fitted = 1;
    if (m_options.charPaneVisible) {
        const int usable = chars - 2;
        fitted = usable > 1 ? usable / (kHexCellChars + 1) : 1;
    } else {
        fitted = chars > 1 ? chars / kHexCellChars : 1;
    }
    fitted = qMax(1, fitted);
    const auto neededChars = [this](int n) {
        const int gaps = isGrouped() ? (n - 1) / m_options.groupSize : 0;
        return n * kHexCellChars + gaps + 1 + (m_options.charPaneVisible ? n : 0);
    };
    while (fitted > 1 && neededChars(fitted) > chars) {
        --fitted;
    }
    if (isGrouped() && fitted >= m_options.groupSize) {
        fitted -= fitted % m_options.groupSize;
    }
    return fitted;
}

}  // namespace hexgrid
