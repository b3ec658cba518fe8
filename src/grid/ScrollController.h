#pragma once

#include <QtGlobal>

namespace hexgrid {

// Virtualized vertical scrolling in whole lines. The line range can exceed the
// native scroll bar range; toNative()/fromNative() translate proportionally
// once scrollMax() reaches kNativeMax.
class ScrollController {
public:
    static constexpr int kNativeMax = 65535;
    static constexpr int kThumbSnapTolerance = 10;

    void reset();

    void setBytesPerLine(int bytesPerLine);
    void setVisibleLines(int visibleLines);
    void setVisibleByteRange(qint64 count);

    // All mutators return true when scrollPos or scrollMax changed.
    bool recomputeBounds(qint64 length);
    bool scrollToLine(qint64 line);
    bool scrollLines(qint64 delta);
    bool scrollPages(qint64 pages);
    bool scrollByteIntoView(qint64 offset);
    bool thumbTrackTo(int nativeValue);

    int bytesPerLine() const;
    int visibleLines() const;
    qint64 visibleBytes() const;
    qint64 length() const;
    qint64 scrollMin() const;
    qint64 scrollMax() const;
    qint64 scrollPos() const;
    qint64 firstVisibleByte() const;
    qint64 lastVisibleByte() const;
    qint64 lastFullyVisibleByte() const;

    int nativeMaximum() const;
    int nativeValue() const;
    int toNative(qint64 scrollPos) const;
    qint64 fromNative(int nativeValue) const;

private:
    int m_bytesPerLine = 16;
    int m_visibleLines = 1;
    qint64 m_length = 0;
    qint64 m_scrollMax = 0;
    qint64 m_scrollPos = 0;
};

}  // namespace hexgrid
