#include "find/FindEngine.h"

#include <stdexcept>
#include <utility>

#include "debug/EditTrace.h"
#include "store/ByteStore.h"
#include "text/ByteCharConverter.h"

namespace hexgrid {

namespace {
constexpr qint64 kReadBlockSize = 64 * 1024;

// Block-cached reader so the scan does not pay one virtual call per byte.
class BlockReader {
public:
    explicit BlockReader(const ByteStore& store) : m_store(store) {}

    quint8 at(qint64 offset) {
        if (offset < m_blockStart || offset >= m_blockStart + m_block.size()) {
            m_blockStart = qMax<qint64>(0, offset - offset % kReadBlockSize);
            m_block = m_store.readRange(m_blockStart, kReadBlockSize);
            if (offset >= m_blockStart + m_block.size()) {
                return m_store.readByte(offset);
            }
        }
        return static_cast<quint8>(m_block.at(static_cast<qsizetype>(offset - m_blockStart)));
    }

private:
    const ByteStore& m_store;
    QByteArray m_block;
    qint64 m_blockStart = 0;
};

class RunningFlag {
public:
    explicit RunningFlag(std::atomic<bool>& flag) : m_flag(flag) { m_flag.store(true); }
    ~RunningFlag() { m_flag.store(false); }

private:
    std::atomic<bool>& m_flag;
};
}  // namespace

FindPattern FindEngine::preparePattern(const FindOptions& options,
                                       const ByteCharConverter& converter) {
    if (options.kind == FindPatternKind::Hex) {
        return makePattern(options.hexBytes);
    }
    if (options.text.isEmpty()) {
        throw std::invalid_argument("find text must not be empty");
    }
    if (options.matchCase) {
        return makePattern(converter.encodeText(options.text));
    }
    const CaseFoldedPattern folded = converter.encodeForSearch(options.text);
    if (folded.lower.isEmpty()) {
        throw std::invalid_argument("lower and upper case encodings differ in length");
    }
    return makePattern(folded.lower, folded.upper);
}

FindPattern FindEngine::makePattern(const QByteArray& primary, const QByteArray& alternate) {
    if (primary.isEmpty()) {
        throw std::invalid_argument("find pattern must not be empty");
    }
    if (!alternate.isEmpty() && alternate.size() != primary.size()) {
        throw std::invalid_argument("case buffers must have the same length");
    }
    return FindPattern{primary, alternate};
}

void FindEngine::setYieldCallback(YieldCallback callback) { m_yield = std::move(callback); }

qint64 FindEngine::find(const ByteStore& store, qint64 start, const FindPattern& pattern,
                        FindDirection direction) {
    if (pattern.primary.isEmpty()) {
        throw std::invalid_argument("find pattern must not be empty");
    }
    if (pattern.hasAlternate() && pattern.alternate.size() != pattern.primary.size()) {
        throw std::invalid_argument("case buffers must have the same length");
    }

    RunningFlag running(m_running);
    m_abort.store(false);

    const bool forward = direction == FindDirection::Forward;
    const qint64 step = forward ? 1 : -1;
    const qint64 patternLength = pattern.length();
    const qint64 length = store.length();
    const char* primary = pattern.primary.constData();
    const char* alternate = pattern.hasAlternate() ? pattern.alternate.constData() : nullptr;
    const qint64 firstIndex = forward ? 0 : patternLength - 1;

    if (debug::editTraceEnabled()) {
        HEXGRID_EDITTRACE(QStringLiteral("FindEngine::find: start=%1 forward=%2 patternLength=%3 "
                                         "caseFolded=%4 length=%5")
                              .arg(start)
                              .arg(forward ? 1 : 0)
                              .arg(patternLength)
                              .arg(alternate != nullptr ? 1 : 0)
                              .arg(length));
    }

    BlockReader reader(store);
    qint64 match = 0;
    qint64 pos = forward ? qMax<qint64>(0, start) : qMin(start, length - 1);
    for (; forward ? pos < length : pos >= 0; pos += step) {
        if (pos % kYieldInterval == 0 && m_yield) {
            m_yield();
        }
        // Checked after the yield so nothing is read from a store the host
        // touched while the event loop ran.
        if (m_abort.load(std::memory_order_relaxed)) {
            m_currentPosition.store(pos);
            HEXGRID_EDITTRACE("FindEngine::find: aborted");
            return kFindAborted;
        }

        const char byte = static_cast<char>(reader.at(pos));
        const qint64 index = firstIndex + match * step;
        const bool isMatch =
            byte == primary[index] || (alternate != nullptr && byte == alternate[index]);
        if (!isMatch) {
            // Restart one position past the first byte of the failed window.
            pos -= match * step;
            match = 0;
            m_currentPosition.store(pos, std::memory_order_relaxed);
            continue;
        }

        ++match;
        if (match == patternLength) {
            const qint64 found = forward ? pos - (patternLength - 1) : pos;
            m_currentPosition.store(found);
            HEXGRID_EDITTRACE(QStringLiteral("FindEngine::find: match at %1").arg(found));
            return found;
        }
    }

    m_currentPosition.store(forward ? length : 0);
    HEXGRID_EDITTRACE("FindEngine::find: not found");
    return kFindNotFound;
}

void FindEngine::abort() { m_abort.store(true); }

bool FindEngine::isRunning() const { return m_running.load(); }

qint64 FindEngine::currentPosition() const { return m_currentPosition.load(); }

}  // namespace hexgrid
