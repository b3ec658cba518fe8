#pragma once

#include <QPoint>
#include <QRect>
#include <QSize>
#include <QtGlobal>

namespace hexgrid {

struct BytePosition {
    qint64 offset = 0;
    int subBytePos = 0;

    bool operator==(const BytePosition& other) const = default;
};

struct GridLayoutOptions {
    int bytesPerLine = 16;
    bool fixedBytesPerLine = false;
    int groupSize = 4;
    bool charPaneVisible = true;
    bool lineInfoVisible = true;
    bool columnInfoVisible = true;
    int lineInfoDigits = 8;
};

// Byte offset <-> grid cell <-> pixel mapping for the hex and char panes.
// Hex columns are kHexCellChars characters wide ("XX "); when groupSize > 1 an
// extra one-character gap follows every complete group of columns.
class GridGeometry {
public:
    static constexpr int kHexCellChars = 3;
    static constexpr int kMarginLeft = 4;
    static constexpr int kColumnInfoPadding = 4;
    static constexpr int kMinLineInfoDigits = 8;
    static constexpr int kMaxLineInfoDigits = 16;

    GridGeometry();

    void setCharSize(const QSize& size);
    QSize charSize() const;
    int charWidth() const;
    int charHeight() const;

    void setOptions(const GridLayoutOptions& options);
    const GridLayoutOptions& options() const;

    // Recomputes the pane rectangles, bytes per line and visible lines for the
    // given content rectangle. Returns true when any derived value changed.
    bool relayout(const QRect& contentRect);

    // Direct overrides used by hosts without a pixel layout.
    void setBytesPerLine(int bytesPerLine);
    void setVisibleLines(int visibleLines);

    int bytesPerLine() const;
    int groupSize() const;
    bool isGrouped() const;
    int visibleLines() const;
    qint64 visibleBytes() const;

    QRect lineInfoRect() const;
    QRect columnInfoRect() const;
    QRect hexRect() const;
    QRect charRect() const;
    int requiredWidth() const;
    int hexPaneWidth() const;

    QPoint gridPointOf(qint64 relativeOffset) const;
    QPoint hexCellOrigin(const QPoint& gridPoint) const;
    QPoint charCellOrigin(const QPoint& gridPoint) const;
    QPoint columnHeaderOrigin(int column) const;

    BytePosition hexPositionAt(const QPoint& pixel, qint64 firstVisibleByte, qint64 length) const;
    qint64 charPositionAt(const QPoint& pixel, qint64 firstVisibleByte, qint64 length) const;

private:
    int gapsBefore(int column) const;
    int fitBytesPerLine(int availableWidth) const;

    QSize m_charSize;
    GridLayoutOptions m_options;
    int m_bytesPerLine = 16;
    int m_visibleLines = 1;
    QRect m_lineInfoRect;
    QRect m_columnInfoRect;
    QRect m_hexRect;
    QRect m_charRect;
    int m_requiredWidth = 0;
};

}  // namespace hexgrid
