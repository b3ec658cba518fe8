#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QRandomGenerator>

#include "find/FindEngine.h"
#include "store/DynamicByteStore.h"
#include "text/ByteCharConverter.h"

namespace {

QByteArray makeAsciiData(int bytes, quint32 seed) {
    QByteArray out;
    out.resize(bytes);
    QRandomGenerator rng(seed);
    for (int i = 0; i < bytes; ++i) {
        const int v = static_cast<int>(rng.generate() % 52U);
        out[i] = (v < 26) ? static_cast<char>('A' + v) : static_cast<char>('a' + (v - 26));
    }
    return out;
}

void plantNeedle(QByteArray& haystack, const QByteArray& needle, int firstPos, int stride) {
    for (int pos = firstPos; pos + needle.size() < haystack.size(); pos += stride) {
        for (int i = 0; i < needle.size(); ++i) {
            haystack[pos + i] = needle.at(i);
        }
    }
}

void benchmarkFind(const hexgrid::ByteStore& store, const hexgrid::FindPattern& pattern,
                   hexgrid::FindDirection direction, const char* label) {
    hexgrid::FindEngine finder;
    QElapsedTimer timer;
    timer.start();

    const bool forward = direction == hexgrid::FindDirection::Forward;
    int matches = 0;
    qint64 from = forward ? 0 : store.length() - 1;
    while (true) {
        const qint64 pos = finder.find(store, from, pattern, direction);
        if (pos < 0) {
            break;
        }
        ++matches;
        from = forward ? pos + pattern.length() : pos - 1;
    }

    const qint64 ns = timer.nsecsElapsed();
    const double sec = static_cast<double>(ns) / 1e9;
    const double mib = static_cast<double>(store.length()) / (1024.0 * 1024.0);
    const double mibPerSec = (sec > 0.0) ? (mib / sec) : 0.0;

    qInfo().noquote() << QStringLiteral("%1: scan=%2 MiB time=%3 ms throughput=%4 MiB/s matches=%5")
                             .arg(QString::fromLatin1(label))
                             .arg(QString::number(mib, 'f', 2))
                             .arg(QString::number(sec * 1000.0, 'f', 2))
                             .arg(QString::number(mibPerSec, 'f', 2))
                             .arg(matches);
}

}  // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    constexpr int kHaystackBytes = 32 * 1024 * 1024;
    QByteArray haystack = makeAsciiData(kHaystackBytes, 2026U);
    const QByteArray needle = QByteArrayLiteral("AbCdEf");
    plantNeedle(haystack, needle, 8192, 131072);
    const hexgrid::DynamicByteStore store(haystack);

    const hexgrid::DefaultByteCharConverter converter;
    hexgrid::FindOptions exact;
    exact.matchCase = true;
    exact.text = QString::fromLatin1(needle);
    hexgrid::FindOptions folded;
    folded.text = QStringLiteral("abcdef");
    hexgrid::FindOptions hex;
    hex.kind = hexgrid::FindPatternKind::Hex;
    hex.hexBytes = needle;

    benchmarkFind(store, hexgrid::FindEngine::preparePattern(exact, converter),
                  hexgrid::FindDirection::Forward, "FindEngine text match-case");
    benchmarkFind(store, hexgrid::FindEngine::preparePattern(folded, converter),
                  hexgrid::FindDirection::Forward, "FindEngine text ignore-case");
    benchmarkFind(store, hexgrid::FindEngine::preparePattern(hex, converter),
                  hexgrid::FindDirection::Backward, "FindEngine hex backward");

    return 0;
}
