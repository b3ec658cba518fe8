#pragma once

#include <atomic>
#include <functional>

#include <QByteArray>
#include <QString>
#include <QtGlobal>

namespace hexgrid {

class ByteStore;
class ByteCharConverter;

constexpr qint64 kFindNotFound = -1;
constexpr qint64 kFindAborted = -2;

enum class FindDirection {
    Forward = 0,
    Backward,
};

enum class FindPatternKind {
    Text = 0,
    Hex,
};

struct FindOptions {
    FindDirection direction = FindDirection::Forward;
    FindPatternKind kind = FindPatternKind::Text;
    bool matchCase = false;
    QString text;
    QByteArray hexBytes;
};

// Byte buffers actually compared during the scan. For case-insensitive text
// both buffers are set and have equal length; otherwise only primary is set.
struct FindPattern {
    QByteArray primary;
    QByteArray alternate;

    qsizetype length() const { return primary.size(); }
    bool hasAlternate() const { return !alternate.isEmpty(); }
};

// Linear byte-by-byte scan with cooperative cancellation. The yield callback
// runs every kYieldInterval positions so the host can pump its event loop;
// abort() may be called from inside it.
class FindEngine {
public:
    static constexpr qint64 kYieldInterval = 1000;

    using YieldCallback = std::function<void()>;

    // Throws std::invalid_argument for an empty pattern or mismatched case
    // buffers.
    static FindPattern preparePattern(const FindOptions& options,
                                      const ByteCharConverter& converter);
    static FindPattern makePattern(const QByteArray& primary,
                                   const QByteArray& alternate = QByteArray());

    void setYieldCallback(YieldCallback callback);

    // Scans from start in the given direction. Returns the lower offset of the
    // match, kFindNotFound or kFindAborted.
    qint64 find(const ByteStore& store, qint64 start, const FindPattern& pattern,
                FindDirection direction);

    void abort();
    bool isRunning() const;
    qint64 currentPosition() const;

private:
    YieldCallback m_yield;
    std::atomic<bool> m_abort{false};
    std::atomic<bool> m_running{false};
    std::atomic<qint64> m_currentPosition{0};
};

}  // namespace hexgrid
