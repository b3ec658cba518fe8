#include <QApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTimer>

#include <memory>
#include <stdexcept>

#include "edit/ChangeTracker.h"
#include "edit/ClipboardCodec.h"
#include "edit/KeyBindings.h"
#include "engine/HexEditEngine.h"
#include "find/FindEngine.h"
#include "grid/GridGeometry.h"
#include "grid/ScrollController.h"
#include "io/ByteFileIo.h"
#include "store/DynamicByteStore.h"
#include "text/ByteCharConverter.h"

namespace {

int g_failures = 0;

void expectTrue(bool condition, const QString& message) {
    if (!condition) {
        qCritical().noquote() << QStringLiteral("FAIL: %1").arg(message);
        ++g_failures;
    }
}

void expectEqInt(qint64 actual, qint64 expected, const QString& message) {
    if (actual != expected) {
        qCritical().noquote()
            << QStringLiteral("FAIL: %1 (actual=%2 expected=%3)")
                   .arg(message)
                   .arg(actual)
                   .arg(expected);
        ++g_failures;
    }
}

void expectEqQString(const QString& actual, const QString& expected, const QString& message) {
    if (actual != expected) {
        qCritical().noquote()
            << QStringLiteral("FAIL: %1 (actual='%2' expected='%3')")
                   .arg(message)
                   .arg(actual)
                   .arg(expected);
        ++g_failures;
    }
}

void expectEqBytes(const QByteArray& actual, const QByteArray& expected, const QString& message) {
    expectEqQString(QString::fromLatin1(actual.toHex()), QString::fromLatin1(expected.toHex()),
                    message);
}

// Engine bound to an in-memory store and clipboard with a fixed grid of
// bytesPerLine x visibleLines and no pixel layout.
struct EditorFixture {
    explicit EditorFixture(const QByteArray& bytes, int bytesPerLine = 4, int visibleLines = 2)
        : store(bytes) {
        engine.setClipboard(&clipboard);
        engine.setBytesPerLine(bytesPerLine);
        engine.setVisibleLines(visibleLines);
        engine.setByteStore(&store);
    }

    bool key(int keyCode, Qt::KeyboardModifiers modifiers = Qt::NoModifier) {
        return engine.handleKey(keyCode, modifiers, QString());
    }

    bool type(const QString& text) {
        bool consumed = true;
        for (const QChar ch : text) {
            consumed = engine.handleKey(0, Qt::NoModifier, QString(ch)) && consumed;
        }
        return consumed;
    }

    hexgrid::DynamicByteStore store;
    hexgrid::MemoryClipboard clipboard;
    hexgrid::HexEditEngine engine;
};

void testDynamicByteStore() {
    hexgrid::DynamicByteStore store(QByteArray("abcdef"));
    QSignalSpy lengthSpy(&store, &hexgrid::ByteStore::lengthChanged);
    QSignalSpy contentSpy(&store, &hexgrid::ByteStore::contentChanged);

    expectEqInt(store.length(), 6, QStringLiteral("DynamicByteStore initial length"));
    expectEqInt(store.readByte(2), 'c', QStringLiteral("DynamicByteStore readByte"));
    expectEqBytes(store.readRange(4, 10), QByteArray("ef"),
                  QStringLiteral("DynamicByteStore readRange should stop at the end"));
    expectTrue(!store.hasChanges(), QStringLiteral("DynamicByteStore starts unchanged"));

    store.insertBytes(6, QByteArray("gh"));
    store.deleteBytes(0, 2);
    store.writeByte(0, 'X');
    expectEqBytes(store.bytes(), QByteArray("Xdefgh"), QStringLiteral("DynamicByteStore edits"));
    expectEqInt(lengthSpy.count(), 2, QStringLiteral("lengthChanged once per insert/delete"));
    expectEqInt(contentSpy.count(), 3, QStringLiteral("contentChanged once per mutation"));
    expectTrue(store.hasChanges(), QStringLiteral("DynamicByteStore tracks changes"));
    store.applyChanges();
    expectTrue(!store.hasChanges(), QStringLiteral("applyChanges clears the changed flag"));

    bool threw = false;
    try {
        store.readByte(-1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("readByte(-1) should throw out_of_range"));

    threw = false;
    try {
        store.deleteBytes(4, 5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("deleteBytes past the end should throw out_of_range"));
    expectEqInt(store.length(), 6, QStringLiteral("rejected delete leaves the store intact"));
}

void testChangeTracker() {
    hexgrid::ChangeTracker changes;
    changes.markDirtyRange(2, 3);
    expectTrue(changes.isDirty(2) && changes.isDirty(4) && !changes.isDirty(5),
               QStringLiteral("markDirtyRange marks [offset, offset + count)"));

    changes.commit();
    expectTrue(changes.dirty().isEmpty(), QStringLiteral("commit empties the dirty set"));
    expectEqInt(changes.committed().size(), 3, QStringLiteral("commit moves dirty to committed"));
    expectTrue(changes.isCommitted(3), QStringLiteral("committed contains offset 3"));

    changes.markDirty(9);
    changes.markDirty(0);
    const QVector<qint64> all = changes.allChanged();
    expectEqInt(all.size(), 5, QStringLiteral("allChanged unions both sets"));
    if (all.size() == 5) {
        expectEqInt(all.first(), 0, QStringLiteral("allChanged is sorted (first)"));
        expectEqInt(all.last(), 9, QStringLiteral("allChanged is sorted (last)"));
    }

    changes.clearCommitted();
    expectTrue(changes.committed().isEmpty(), QStringLiteral("clearCommitted"));
    expectTrue(changes.isDirty(9), QStringLiteral("clearCommitted keeps dirty offsets"));
}

void testKeyBindings() {
    const hexgrid::KeyBindings bindings = hexgrid::KeyBindings::defaults();
    expectTrue(bindings.resolve(Qt::Key_Left, Qt::NoModifier) == hexgrid::EditorCommand::MoveLeft,
               QStringLiteral("Left resolves to MoveLeft"));
    expectTrue(bindings.resolve(Qt::Key_Left, Qt::ShiftModifier) ==
                   hexgrid::EditorCommand::ExtendLeft,
               QStringLiteral("Shift+Left resolves to ExtendLeft"));
    expectTrue(bindings.resolve(Qt::Key_Left, Qt::KeypadModifier) ==
                   hexgrid::EditorCommand::MoveLeft,
               QStringLiteral("keypad modifier is ignored"));
    expectTrue(bindings.resolve(Qt::Key_C, Qt::ControlModifier) == hexgrid::EditorCommand::Copy,
               QStringLiteral("Ctrl+C resolves to Copy"));
    expectTrue(bindings.resolve(Qt::Key_A, Qt::NoModifier) == hexgrid::EditorCommand::None,
               QStringLiteral("plain letters are not bound"));

    hexgrid::KeyBindings custom = bindings;
    custom.unbind(Qt::Key_Left, Qt::NoModifier);
    custom.bind(Qt::Key_H, Qt::AltModifier, hexgrid::EditorCommand::MoveLeft);
    expectTrue(custom.resolve(Qt::Key_Left, Qt::NoModifier) == hexgrid::EditorCommand::None,
               QStringLiteral("unbind removes the entry"));
    expectTrue(custom.resolve(Qt::Key_H, Qt::AltModifier) == hexgrid::EditorCommand::MoveLeft,
               QStringLiteral("custom binding resolves"));
    expectEqQString(QString::fromLatin1(
                        hexgrid::KeyBindings::commandName(hexgrid::EditorCommand::DeleteBackward)),
                    QStringLiteral("DeleteBackward"), QStringLiteral("commandName"));
}

void testByteCharConverters() {
    const hexgrid::DefaultByteCharConverter ansi;
    expectTrue(ansi.byteToChar(0x00) == hexgrid::ByteCharConverter::kFiller,
               QStringLiteral("default converter shows filler for 0x00"));
    expectTrue(ansi.byteToChar(0x7F) == hexgrid::ByteCharConverter::kFiller,
               QStringLiteral("default converter shows filler for 0x7F"));
    expectTrue(ansi.byteToChar('A') == QLatin1Char('A'),
               QStringLiteral("default converter keeps printable ASCII"));
    expectEqInt(ansi.charToByte(QChar(0x20AC)), '?',
                QStringLiteral("default converter maps unencodable chars to '?'"));

    const hexgrid::CodecByteCharConverter utf8(QStringLiteral("UTF-8"));
    expectTrue(utf8.isValid(), QStringLiteral("UTF-8 converter is valid"));
    const QByteArray bytes = QByteArray::fromHex("c3a941");
    expectEqQString(utf8.bytesToDisplayString(bytes), QString::fromUtf8("\xc3\xa9.A"),
                    QStringLiteral("UTF-8 display keeps one char per byte"));
    expectEqBytes(utf8.encodeText(QString::fromUtf8("\xc3\xa9")), QByteArray::fromHex("c3a9"),
                  QStringLiteral("UTF-8 encodeText"));

    const hexgrid::CodecByteCharConverter bogus(QStringLiteral("no-such-encoding"));
    expectTrue(!bogus.isValid(), QStringLiteral("unknown encoding is invalid"));
    expectTrue(bogus.byteToChar('A') == QLatin1Char('A'),
               QStringLiteral("invalid converter falls back to the default mapping"));

    const hexgrid::CaseFoldedPattern folded = ansi.encodeForSearch(QStringLiteral("HeLLo"));
    expectEqBytes(folded.lower, QByteArray("hello"), QStringLiteral("encodeForSearch lower"));
    expectEqBytes(folded.upper, QByteArray("HELLO"), QStringLiteral("encodeForSearch upper"));
}

void testClipboardCodec() {
    using hexgrid::ClipboardCodec;
    expectEqQString(ClipboardCodec::toHexText(QByteArray("\x0a\xff", 2), false),
                    QStringLiteral("0AFF"), QStringLiteral("toHexText upper case"));
    expectEqQString(ClipboardCodec::toHexText(QByteArray("\x0a\xff", 2), true),
                    QStringLiteral("0aff"), QStringLiteral("toHexText lower case"));

    const auto spaced = ClipboardCodec::parseHexText(QStringLiteral("41 42-43_44"));
    expectTrue(spaced.has_value() && *spaced == QByteArray("ABCD"),
               QStringLiteral("parseHexText strips separators"));
    const auto odd = ClipboardCodec::parseHexText(QStringLiteral("142"));
    expectTrue(odd.has_value() && *odd == QByteArray::fromHex("0142"),
               QStringLiteral("parseHexText left-pads odd digit counts"));
    expectTrue(!ClipboardCodec::parseHexText(QStringLiteral("4G")).has_value(),
               QStringLiteral("parseHexText rejects non-hex pairs"));
    expectTrue(!ClipboardCodec::parseHexText(QString()).has_value(),
               QStringLiteral("parseHexText rejects empty text"));
    expectTrue(!ClipboardCodec::parseHexText(QStringLiteral(" - _ ")).has_value(),
               QStringLiteral("parseHexText rejects separators without digits"));
}

void testScrollController() {
    hexgrid::ScrollController scroll;
    scroll.setBytesPerLine(4);
    scroll.setVisibleLines(2);

    scroll.recomputeBounds(0);
    expectEqInt(scroll.scrollMax(), 0, QStringLiteral("empty store has no scroll range"));
    scroll.recomputeBounds(7);
    expectEqInt(scroll.scrollMax(), 0, QStringLiteral("one screen minus a byte fits"));
    scroll.recomputeBounds(11);
    expectEqInt(scroll.scrollMax(), 1, QStringLiteral("append row adds a line"));
    scroll.recomputeBounds(12);
    expectEqInt(scroll.scrollMax(), 2, QStringLiteral("exact multiple leaves an append row"));

    expectTrue(scroll.scrollByteIntoView(8), QStringLiteral("byte below the view scrolls"));
    expectEqInt(scroll.scrollPos(), 1, QStringLiteral("scrolls just far enough"));
    expectEqInt(scroll.firstVisibleByte(), 4, QStringLiteral("firstVisibleByte follows scrollPos"));
    expectTrue(!scroll.scrollByteIntoView(5), QStringLiteral("visible byte does not scroll"));

    scroll.scrollToLine(99);
    expectEqInt(scroll.scrollPos(), 2, QStringLiteral("scrollToLine clamps to scrollMax"));
    scroll.scrollLines(-5);
    expectEqInt(scroll.scrollPos(), 0, QStringLiteral("scrollLines clamps to scrollMin"));

    scroll.recomputeBounds(12);
    scroll.scrollToLine(2);
    scroll.recomputeBounds(8);
    expectEqInt(scroll.scrollMax(), 1, QStringLiteral("shrunk store lowers scrollMax"));
    expectEqInt(scroll.scrollPos(), 1, QStringLiteral("view at the bottom follows a shrink"));
    scroll.recomputeBounds(16);
    scroll.scrollToLine(1);
    scroll.recomputeBounds(12);
    expectEqInt(scroll.scrollPos(), 1, QStringLiteral("view above the bottom stays put"));

    hexgrid::ScrollController large;
    large.setBytesPerLine(1);
    large.setVisibleLines(1);
    large.recomputeBounds(200000);
    expectEqInt(large.scrollMax(), 200000, QStringLiteral("large scrollMax"));
    expectEqInt(large.nativeMaximum(), hexgrid::ScrollController::kNativeMax,
                QStringLiteral("native range is capped"));
    large.thumbTrackTo(hexgrid::ScrollController::kNativeMax - 5);
    expectEqInt(large.scrollPos(), 200000, QStringLiteral("thumb near the end snaps to scrollMax"));
    large.thumbTrackTo(hexgrid::ScrollController::kNativeMax / 2);
    expectTrue(large.scrollPos() > 90000 && large.scrollPos() < 110000,
               QStringLiteral("thumb at half maps proportionally"));

    hexgrid::ScrollController small;
    small.setBytesPerLine(1);
    small.setVisibleLines(1);
    small.recomputeBounds(100);
    small.thumbTrackTo(static_cast<int>(small.scrollMax()) - 1);
    expectEqInt(small.scrollPos(), small.scrollMax() - 1,
                QStringLiteral("small ranges track the thumb exactly"));
}

void testGridGeometryHitTesting() {
    hexgrid::GridGeometry geometry;
    geometry.setCharSize(QSize(8, 16));
    hexgrid::GridLayoutOptions options;
    options.bytesPerLine = 8;
    options.fixedBytesPerLine = true;
    options.groupSize = 4;
    geometry.setOptions(options);
    geometry.relayout(QRect(0, 0, 800, 400));

    expectEqInt(geometry.bytesPerLine(), 8, QStringLiteral("fixed bytes per line"));
    expectEqInt(geometry.hexPaneWidth(), 8 * (24 + 1 + 1),
                QStringLiteral("hex pane width includes group gaps"));

    const QPoint cell = geometry.hexCellOrigin(geometry.gridPointOf(5));
    const hexgrid::BytePosition high = geometry.hexPositionAt(cell + QPoint(1, 1), 0, 64);
    expectEqInt(high.offset, 5, QStringLiteral("hex hit offset"));
    expectEqInt(high.subBytePos, 0, QStringLiteral("first digit is the high nibble"));
    const hexgrid::BytePosition low = geometry.hexPositionAt(cell + QPoint(9, 1), 0, 64);
    expectEqInt(low.subBytePos, 1, QStringLiteral("second digit is the low nibble"));

    const QPoint charCell = geometry.charCellOrigin(geometry.gridPointOf(9));
    expectEqInt(geometry.charPositionAt(charCell + QPoint(1, 1), 0, 64), 9,
                QStringLiteral("char hit offset"));

    // The gap between columns 3 and 4 belongs to neither cell.
    const QPoint gap = geometry.hexCellOrigin(geometry.gridPointOf(3)) + QPoint(3 * 8 + 2, 1);
    const hexgrid::BytePosition inGap = geometry.hexPositionAt(gap, 0, 64);
    expectEqInt(inGap.offset, 4, QStringLiteral("gap click resolves to the next group's column"));
    expectEqInt(inGap.subBytePos, 0, QStringLiteral("gap click lands on the high nibble"));

    const QPoint pastEnd(geometry.hexRect().right() + 50, geometry.hexRect().y() + 1);
    const hexgrid::BytePosition beyond = geometry.hexPositionAt(pastEnd, 0, 64);
    expectEqInt(beyond.offset, 7, QStringLiteral("click past the last column clamps to it"));
    expectEqInt(beyond.subBytePos, 1, QStringLiteral("clamped click takes the low nibble"));

    const QPoint belowData = geometry.hexCellOrigin(geometry.gridPointOf(13)) + QPoint(9, 1);
    const hexgrid::BytePosition append = geometry.hexPositionAt(belowData, 0, 10);
    expectEqInt(append.offset, 10, QStringLiteral("click past the data clamps to the append slot"));
    expectEqInt(append.subBytePos, 0, QStringLiteral("append slot has no low nibble"));
}

void expectCellRoundTrip(const hexgrid::GridGeometry& geometry, const QString& layout) {
    const qint64 first = 3 * geometry.bytesPerLine();
    const qint64 visible = geometry.visibleBytes();
    const qint64 length = first + visible;
    int mismatches = 0;
    for (qint64 relative = 0; relative < visible; ++relative) {
        const QPoint gridPoint = geometry.gridPointOf(relative);
        const QPoint hexPixel = geometry.hexCellOrigin(gridPoint) + QPoint(1, 1);
        const hexgrid::BytePosition hex = geometry.hexPositionAt(hexPixel, first, length);
        const QPoint lowPixel = hexPixel + QPoint(geometry.charWidth(), 0);
        const hexgrid::BytePosition low = geometry.hexPositionAt(lowPixel, first, length);
        const QPoint charPixel = geometry.charCellOrigin(gridPoint) + QPoint(1, 1);
        if (hex.offset != first + relative || hex.subBytePos != 0 ||
            low.offset != first + relative || low.subBytePos != 1 ||
            geometry.charPositionAt(charPixel, first, length) != first + relative) {
            ++mismatches;
        }
    }
    expectTrue(visible > 0, QStringLiteral("%1 layout has visible cells").arg(layout));
    expectEqInt(mismatches, 0,
                QStringLiteral("%1 layout maps every cell back to its offset").arg(layout));
}

void testGridGeometryRoundTrip() {
    for (const int groupSize : {4, 1}) {
        hexgrid::GridGeometry geometry;
        geometry.setCharSize(QSize(7, 15));
        hexgrid::GridLayoutOptions options;
        options.bytesPerLine = 16;
        options.fixedBytesPerLine = true;
        options.groupSize = groupSize;
        geometry.setOptions(options);
        geometry.relayout(QRect(0, 0, 1000, 300));
        expectEqInt(geometry.isGrouped() ? 1 : 0, groupSize > 1 ? 1 : 0,
                    QStringLiteral("grouping follows groupSize"));
        expectCellRoundTrip(geometry, groupSize > 1 ? QStringLiteral("grouped")
                                                    : QStringLiteral("ungrouped"));
    }
}

void testFindEngine() {
    hexgrid::FindEngine finder;
    const hexgrid::DefaultByteCharConverter converter;

    hexgrid::DynamicByteStore text(QByteArray("xxabxx"));
    const hexgrid::FindPattern ab = hexgrid::FindEngine::makePattern(QByteArray("ab"));
    expectEqInt(finder.find(text, 0, ab, hexgrid::FindDirection::Forward), 2,
                QStringLiteral("forward find"));
    expectEqInt(finder.find(text, 5, ab, hexgrid::FindDirection::Backward), 2,
                QStringLiteral("backward find reports the lower offset"));
    expectEqInt(finder.find(text, 3, ab, hexgrid::FindDirection::Forward), hexgrid::kFindNotFound,
                QStringLiteral("forward find past the match"));

    hexgrid::DynamicByteStore overlapping(QByteArray("aaab"));
    expectEqInt(finder.find(overlapping, 0, hexgrid::FindEngine::makePattern(QByteArray("aab")),
                            hexgrid::FindDirection::Forward),
                1, QStringLiteral("partial matches rewind"));

    hexgrid::FindOptions options;
    options.text = QStringLiteral("HeLLo");
    hexgrid::DynamicByteStore hello(QByteArray("xxhelloxx"));
    expectEqInt(finder.find(hello, 0, hexgrid::FindEngine::preparePattern(options, converter),
                            hexgrid::FindDirection::Forward),
                2, QStringLiteral("case-insensitive text find"));
    options.matchCase = true;
    expectEqInt(finder.find(hello, 0, hexgrid::FindEngine::preparePattern(options, converter),
                            hexgrid::FindDirection::Forward),
                hexgrid::kFindNotFound, QStringLiteral("case-sensitive text find"));

    bool threw = false;
    try {
        hexgrid::FindOptions empty;
        empty.kind = hexgrid::FindPatternKind::Hex;
        hexgrid::FindEngine::preparePattern(empty, converter);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("empty pattern throws invalid_argument"));

    hexgrid::DynamicByteStore zeros(QByteArray(5000, '\0'));
    int yields = 0;
    finder.setYieldCallback([&]() {
        ++yields;
        if (yields == 2) {
            finder.abort();
        }
    });
    expectEqInt(finder.find(zeros, 0, hexgrid::FindEngine::makePattern(QByteArray(1, '\xff')),
                            hexgrid::FindDirection::Forward),
                hexgrid::kFindAborted, QStringLiteral("abort from the yield callback"));
    expectTrue(!finder.isRunning(), QStringLiteral("find is not running after it returns"));
    expectEqInt(finder.currentPosition(), hexgrid::FindEngine::kYieldInterval,
                QStringLiteral("currentPosition reports where the scan stopped"));
}

void testFindBlocksMutation() {
    EditorFixture fx(QByteArray(200 * 1024, '\0'), 16, 4);
    hexgrid::DynamicByteStore other(QByteArray("other"));
    hexgrid::FindOptions options;
    options.kind = hexgrid::FindPatternKind::Hex;
    options.hexBytes = QByteArray(1, '\xff');

    bool ran = false;
    bool cutAccepted = true;
    bool swapAccepted = true;
    QTimer::singleShot(0, &fx.engine, [&]() {
        ran = fx.engine.isFindRunning();
        fx.engine.select(0, 150000);
        cutAccepted = fx.engine.cut();
        fx.engine.goTo(10);
        fx.engine.setReadOnly(true);
        swapAccepted = fx.engine.setByteStore(&other);
    });
    const qint64 found = fx.engine.find(options);
    expectTrue(ran, QStringLiteral("timer fired while the find was running"));
    expectTrue(!cutAccepted, QStringLiteral("cut is refused during a find"));
    expectTrue(!swapAccepted, QStringLiteral("store swap is refused during a find"));
    expectEqInt(found, hexgrid::kFindAborted, QStringLiteral("refused swap aborts the find"));
    expectTrue(fx.engine.byteStore() == &fx.store, QStringLiteral("original store stays bound"));
    expectEqInt(fx.store.length(), 200 * 1024, QStringLiteral("store untouched during the find"));
    expectEqInt(fx.engine.selectionStart(), 0, QStringLiteral("goTo ignored during the find"));
    expectEqInt(fx.engine.selectionLength(), 0, QStringLiteral("select ignored during the find"));
    expectTrue(!fx.engine.isReadOnly(), QStringLiteral("option change ignored during the find"));
    expectTrue(fx.engine.setByteStore(&other), QStringLiteral("swap accepted once the find ends"));

    EditorFixture shrink(QByteArray(200 * 1024, '\0'), 16, 4);
    QTimer::singleShot(0, &shrink.engine, [&]() { shrink.store.deleteBytes(0, 150000); });
    qint64 shrinkFound = 0;
    bool threw = false;
    try {
        shrinkFound = shrink.engine.find(options);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expectTrue(!threw, QStringLiteral("store shrinking under a find does not throw"));
    expectEqInt(shrinkFound, hexgrid::kFindAborted,
                QStringLiteral("store shrinking under a find aborts it"));
    expectEqInt(shrink.engine.length(), 200 * 1024 - 150000,
                QStringLiteral("engine sees the shrunk store"));
}

void testHexEntryOverwriteAndInsert() {
    EditorFixture fx(QByteArray(2, '\0'));
    expectTrue(fx.engine.inputMode() == hexgrid::InputMode::HexEntry,
               QStringLiteral("binding a store enters hex entry"));

    fx.type(QStringLiteral("a"));
    expectEqInt(fx.engine.subBytePos(), 1, QStringLiteral("first digit moves to the low nibble"));
    fx.type(QStringLiteral("b"));
    expectEqBytes(fx.store.bytes(), QByteArray::fromHex("ab00"),
                  QStringLiteral("two digits overwrite a byte"));
    expectEqInt(fx.engine.selectionStart(), 1, QStringLiteral("cursor advances a byte"));
    expectEqInt(fx.engine.subBytePos(), 0, QStringLiteral("cursor back on the high nibble"));
    expectTrue(fx.engine.changes().isDirty(0), QStringLiteral("edited offset is dirty"));

    fx.engine.setInsertActive(true);
    fx.type(QStringLiteral("12"));
    expectEqBytes(fx.store.bytes(), QByteArray::fromHex("ab1200"),
                  QStringLiteral("insert mode inserts on the high nibble"));

    fx.key(Qt::Key_End);
    fx.engine.setInsertActive(false);
    fx.type(QStringLiteral("f1"));
    expectEqBytes(fx.store.bytes(), QByteArray::fromHex("ab1200f1"),
                  QStringLiteral("typing at the end appends"));
    expectEqInt(fx.engine.selectionStart(), 4, QStringLiteral("cursor after the appended byte"));

    expectTrue(!fx.type(QStringLiteral("z")), QStringLiteral("non-hex text is not consumed"));
    expectEqInt(fx.store.length(), 4, QStringLiteral("non-hex text leaves the store alone"));
}

void testCharEntryReplacesSelection() {
    EditorFixture fx(QByteArray("ABCD"));
    fx.engine.setInputMode(hexgrid::InputMode::CharEntry);
    fx.engine.select(1, 2);
    fx.type(QStringLiteral("z"));
    expectEqBytes(fx.store.bytes(), QByteArray("AzD"),
                  QStringLiteral("typing replaces the selection"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("cursor after the typed byte"));
    expectEqInt(fx.engine.selectionLength(), 0, QStringLiteral("selection released"));
}

void testReadOnlyConsumesInput() {
    EditorFixture fx(QByteArray("AB"));
    fx.engine.setReadOnly(true);
    expectTrue(fx.type(QStringLiteral("f")), QStringLiteral("read-only still consumes hex digits"));
    fx.key(Qt::Key_Delete);
    fx.key(Qt::Key_Backspace);
    expectEqBytes(fx.store.bytes(), QByteArray("AB"), QStringLiteral("read-only store unchanged"));
}

void testDeleteKeys() {
    EditorFixture fx(QByteArray("ABCDEF"));
    fx.engine.goTo(2);
    fx.engine.setInsertActive(true);
    fx.type(QStringLiteral("7a"));
    expectEqBytes(fx.store.bytes(), QByteArray("AB\x7a" "CDEF"),
                  QStringLiteral("insert a byte before Backspace"));
    fx.key(Qt::Key_Backspace);
    expectEqBytes(fx.store.bytes(), QByteArray("ABCDEF"),
                  QStringLiteral("Backspace removes the byte before the cursor"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("Backspace steps back"));

    fx.key(Qt::Key_Delete);
    expectEqBytes(fx.store.bytes(), QByteArray("ABDEF"), QStringLiteral("Delete removes forward"));

    fx.engine.select(1, 2);
    fx.key(Qt::Key_Backspace);
    expectEqBytes(fx.store.bytes(), QByteArray("AEF"), QStringLiteral("Backspace deletes selection"));
    expectEqInt(fx.engine.selectionStart(), 1, QStringLiteral("cursor at the deleted range"));

    fx.key(Qt::Key_End);
    fx.key(Qt::Key_Delete);
    expectEqInt(fx.store.length(), 3, QStringLiteral("Delete at the end is a no-op"));
    fx.key(Qt::Key_Backspace);
    expectEqBytes(fx.store.bytes(), QByteArray("AE"), QStringLiteral("Backspace at the end"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("cursor stays on the append slot"));

    EditorFixture noDelete(QByteArray("AB"));
    hexgrid::EditOptions options = noDelete.engine.options();
    options.enableDelete = false;
    noDelete.engine.setOptions(options);
    noDelete.key(Qt::Key_Delete);
    expectEqInt(noDelete.store.length(), 2, QStringLiteral("disabled delete is ignored"));
}

void testNavigation() {
    EditorFixture fx(QByteArray(10, '\x11'));
    fx.engine.goTo(5);
    expectEqInt(fx.engine.currentLine(), 2, QStringLiteral("currentLine is 1-based"));
    expectEqInt(fx.engine.currentPositionInLine(), 2,
                QStringLiteral("currentPositionInLine is 1-based"));

    fx.key(Qt::Key_Up);
    expectEqInt(fx.engine.selectionStart(), 1, QStringLiteral("Up moves a line"));
    fx.engine.select(1, 1);
    fx.key(Qt::Key_Up);
    expectEqInt(fx.engine.selectionStart(), 1, QStringLiteral("Up on the first line stays"));
    expectEqInt(fx.engine.selectionLength(), 0, QStringLiteral("Up releases the selection"));

    fx.key(Qt::Key_Right);
    expectEqInt(fx.engine.subBytePos(), 1, QStringLiteral("Right steps a nibble in hex entry"));
    fx.key(Qt::Key_Left);
    fx.key(Qt::Key_Left);
    expectEqInt(fx.engine.selectionStart(), 0, QStringLiteral("Left steps back over the byte"));
    expectEqInt(fx.engine.subBytePos(), 1, QStringLiteral("Left lands on the low nibble"));

    fx.key(Qt::Key_PageDown);
    expectEqInt(fx.engine.selectionStart(), 8, QStringLiteral("PageDown moves a screen"));
    fx.key(Qt::Key_PageDown);
    expectEqInt(fx.engine.selectionStart(), 10, QStringLiteral("PageDown clamps to the end"));
    expectTrue(fx.engine.scroll().scrollPos() > 0, QStringLiteral("PageDown scrolls the view"));
    fx.key(Qt::Key_End);
    expectEqInt(fx.engine.selectionStart(), 10, QStringLiteral("End at the end is a no-op"));
    fx.key(Qt::Key_PageUp);
    fx.key(Qt::Key_PageUp);
    expectEqInt(fx.engine.selectionStart(), 0, QStringLiteral("PageUp clamps to the start"));

    fx.engine.select(3, 2);
    fx.key(Qt::Key_Home);
    expectEqInt(fx.engine.selectionStart(), 0, QStringLiteral("Home moves to the start"));
    expectEqInt(fx.engine.selectionLength(), 0, QStringLiteral("Home releases the selection"));

    fx.engine.select(3, 2);
    fx.key(Qt::Key_Right);
    expectEqInt(fx.engine.selectionStart(), 5, QStringLiteral("Right collapses to the end"));

    bool threw = false;
    try {
        fx.engine.select(0, fx.engine.length() + 1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("select past the end throws out_of_range"));

    threw = false;
    try {
        fx.engine.setBytesPerLine(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("setBytesPerLine(0) throws invalid_argument"));
}

void testShiftSelectionIsSymmetric() {
    EditorFixture fx(QByteArray(10, '\0'));
    fx.engine.goTo(5);
    const auto expectSelection = [&](qint64 start, qint64 length, const QString& step) {
        expectEqInt(fx.engine.selectionStart(), start, step + QStringLiteral(" start"));
        expectEqInt(fx.engine.selectionLength(), length, step + QStringLiteral(" length"));
    };

    fx.key(Qt::Key_Right, Qt::ShiftModifier);
    fx.key(Qt::Key_Right, Qt::ShiftModifier);
    expectSelection(5, 2, QStringLiteral("extend right twice"));
    fx.key(Qt::Key_Left, Qt::ShiftModifier);
    fx.key(Qt::Key_Left, Qt::ShiftModifier);
    expectSelection(5, 0, QStringLiteral("shrink back to the anchor"));
    fx.key(Qt::Key_Left, Qt::ShiftModifier);
    expectSelection(4, 1, QStringLiteral("extend left past the anchor"));
    fx.key(Qt::Key_Left, Qt::ShiftModifier);
    expectSelection(3, 2, QStringLiteral("extend left again"));
    fx.key(Qt::Key_Right, Qt::ShiftModifier);
    expectSelection(4, 1, QStringLiteral("shrink from the left"));

    fx.key(Qt::Key_Down, Qt::ShiftModifier);
    expectSelection(5, 3, QStringLiteral("extend down moves the free edge a line"));
}

void testClipboardOperations() {
    EditorFixture fx(QByteArray("AB"));
    fx.engine.select(0, 2);
    QSignalSpy copiedSpy(&fx.engine, &hexgrid::HexEditEngine::copied);
    const auto payload = fx.engine.copy(false);
    expectTrue(payload.has_value(), QStringLiteral("copy with a selection"));
    expectEqQString(fx.clipboard.text(), QStringLiteral("AB"), QStringLiteral("copy as text"));
    expectEqBytes(fx.clipboard.rawBytes(), QByteArray("AB"), QStringLiteral("copy raw bytes"));
    expectEqInt(copiedSpy.count(), 1, QStringLiteral("copied emitted once"));
    fx.engine.copy(true);
    expectEqQString(fx.clipboard.text(), QStringLiteral("4142"), QStringLiteral("copy as hex"));

    expectTrue(fx.engine.cut(), QStringLiteral("cut succeeds"));
    expectEqInt(fx.store.length(), 0, QStringLiteral("cut removes the selection"));
    expectTrue(!fx.engine.canCopy(), QStringLiteral("nothing to copy without a selection"));

    fx.clipboard.clear();
    fx.clipboard.setText(QStringLiteral("4142"));
    expectTrue(fx.engine.canPasteHex(), QStringLiteral("hex text can be pasted as hex"));
    expectTrue(fx.engine.paste(true), QStringLiteral("paste hex"));
    expectEqBytes(fx.store.bytes(), QByteArray("AB"), QStringLiteral("paste hex bytes"));
    expectTrue(fx.engine.changes().isDirty(0) && fx.engine.changes().isDirty(1),
               QStringLiteral("pasted bytes are dirty"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("cursor after pasted bytes"));

    fx.clipboard.setText(QStringLiteral("142"));
    fx.engine.goTo(0);
    expectTrue(fx.engine.paste(true), QStringLiteral("paste odd-length hex"));
    expectEqBytes(fx.store.bytes(), QByteArray::fromHex("01424142"),
                  QStringLiteral("odd-length hex paste left-pads the first digit"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("cursor after odd hex paste"));
    fx.engine.select(0, 2);
    fx.key(Qt::Key_Delete);

    fx.clipboard.setText(QStringLiteral("  "));
    expectTrue(!fx.engine.canPasteHex(), QStringLiteral("blank text cannot be pasted as hex"));

    fx.clipboard.setText(QStringLiteral("4G"));
    expectTrue(!fx.engine.canPasteHex(), QStringLiteral("malformed hex cannot be pasted"));
    expectTrue(!fx.engine.paste(true), QStringLiteral("malformed hex paste is rejected"));
    expectEqBytes(fx.store.bytes(), QByteArray("AB"),
                  QStringLiteral("rejected paste leaves the store unchanged"));

    EditorFixture overwrite(QByteArray("ABCD"));
    hexgrid::EditOptions options = overwrite.engine.options();
    options.enableOverwritePaste = true;
    overwrite.engine.setOptions(options);
    overwrite.engine.goTo(3);
    overwrite.clipboard.setRawBytes(QByteArray("xyz"));
    overwrite.engine.paste(false);
    expectEqBytes(overwrite.store.bytes(), QByteArray("ABCxyz"),
                  QStringLiteral("overwrite paste replaces up to the end"));

    EditorFixture readOnly(QByteArray("AB"));
    readOnly.engine.setReadOnly(true);
    readOnly.clipboard.setText(QStringLiteral("x"));
    expectTrue(!readOnly.engine.canPaste(), QStringLiteral("read-only cannot paste"));
    readOnly.engine.selectAll();
    expectTrue(!readOnly.engine.canCut(), QStringLiteral("read-only cannot cut"));
    expectTrue(readOnly.engine.canCopy(), QStringLiteral("read-only can still copy"));
}

void testDeleteInsertRoundTrip() {
    const QByteArray original("ABCDEFGH");
    EditorFixture fx(original);
    fx.engine.select(2, 3);
    fx.engine.copy(false);
    fx.key(Qt::Key_Delete);
    expectEqBytes(fx.store.bytes(), QByteArray("ABFGH"), QStringLiteral("selection deleted"));
    expectEqInt(fx.engine.selectionStart(), 2, QStringLiteral("cursor at the deleted offset"));
    expectTrue(fx.engine.paste(false), QStringLiteral("paste the deleted bytes back"));
    expectEqBytes(fx.store.bytes(), original, QStringLiteral("delete then insert restores the data"));
}

void testEngineFind() {
    EditorFixture fx(QByteArray(256, '\0'), 16, 4);
    hexgrid::FindOptions options;
    options.kind = hexgrid::FindPatternKind::Hex;
    options.hexBytes = QByteArray(1, '\0');
    expectEqInt(fx.engine.find(options), 0, QStringLiteral("first find"));
    expectEqInt(fx.engine.selectionLength(), 1, QStringLiteral("match is selected"));
    expectEqInt(fx.engine.find(options), 1, QStringLiteral("find next continues after the match"));

    EditorFixture text(QByteArray("....needle......"), 4, 1);
    hexgrid::FindOptions needle;
    needle.text = QStringLiteral("needle");
    expectEqInt(text.engine.find(needle), 4, QStringLiteral("text find"));
    expectEqInt(text.engine.selectionLength(), 6, QStringLiteral("whole match selected"));
    expectTrue(text.engine.scroll().firstVisibleByte() <= 4,
               QStringLiteral("match start scrolled into view"));

    needle.text = QStringLiteral("absent");
    expectEqInt(text.engine.find(needle), hexgrid::kFindNotFound, QStringLiteral("no match"));
    expectEqInt(text.engine.selectionStart(), 4, QStringLiteral("no match keeps the selection"));

    hexgrid::HexEditEngine unbound;
    hexgrid::FindOptions empty;
    empty.kind = hexgrid::FindPatternKind::Hex;
    bool threw = false;
    try {
        unbound.find(empty);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expectTrue(threw, QStringLiteral("empty pattern is rejected even without a store"));
}

void testNotifyAfterCommand() {
    EditorFixture fx(QByteArray("ABC"));
    fx.engine.goTo(2);
    int emissions = 0;
    qint64 lengthInSlot = -1;
    qint64 startInSlot = -1;
    QObject::connect(&fx.engine, &hexgrid::HexEditEngine::selectionStartChanged, &fx.engine,
                     [&](qint64 start) {
                         ++emissions;
                         lengthInSlot = fx.store.length();
                         startInSlot = start;
                     });
    fx.key(Qt::Key_Backspace);
    expectEqInt(emissions, 1, QStringLiteral("selectionStartChanged emitted once per command"));
    expectEqInt(lengthInSlot, 2, QStringLiteral("store already updated inside the slot"));
    expectEqInt(startInSlot, 1, QStringLiteral("slot sees the final cursor"));
}

void testStoreSwap() {
    hexgrid::DynamicByteStore first(QByteArray(4, '\0'));
    hexgrid::DynamicByteStore second(QByteArray(4, '\0'), QSet<qint64>{3});
    hexgrid::HexEditEngine engine;
    engine.setByteStore(&first);
    engine.handleKey(0, Qt::NoModifier, QStringLiteral("f"));
    expectTrue(engine.changes().isDirty(0), QStringLiteral("typed offset is dirty"));

    engine.setByteStore(&second);
    expectTrue(engine.changes().dirty().isEmpty(),
               QStringLiteral("swap clears dirty offsets by default"));
    expectEqInt(engine.selectionStart(), 0, QStringLiteral("swap resets the cursor"));

    hexgrid::EditOptions options = engine.options();
    options.retainDirtyOnSwap = true;
    engine.setOptions(options);
    engine.setByteStore(&first);
    engine.setByteStore(&second);
    expectTrue(engine.changes().isDirty(3), QStringLiteral("retained swap adopts seeded offsets"));

    engine.setByteStore(&first);
    engine.handleKey(0, Qt::NoModifier, QStringLiteral("1"));
    options.autoCommitOnSwap = true;
    engine.setOptions(options);
    engine.setByteStore(&second);
    expectTrue(engine.changes().isCommitted(0), QStringLiteral("auto-commit moves dirty offsets"));

    engine.setByteStore(nullptr);
    expectTrue(engine.inputMode() == hexgrid::InputMode::Empty,
               QStringLiteral("no store means no input mode"));
    expectEqInt(engine.selectionStart(), -1, QStringLiteral("no store means no cursor"));
}

void testExternalMutationClampsCursor() {
    EditorFixture fx(QByteArray("ABCDEF"));
    fx.key(Qt::Key_End);
    fx.store.deleteBytes(0, 4);
    expectEqInt(fx.engine.selectionStart(), 2,
                QStringLiteral("external delete clamps the cursor to the new length"));
}

void testByteFileIo() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("temporary directory"));
    if (!tempDir.isValid()) {
        return;
    }
    const QString filePath = QDir(tempDir.path()).filePath(QStringLiteral("data.bin"));
    const QByteArray bytes = QByteArray::fromHex("00ff10203040");
    expectTrue(hexgrid::ByteFileIo::saveFile(filePath, bytes), QStringLiteral("saveFile"));
    const auto loaded = hexgrid::ByteFileIo::loadFile(filePath);
    expectTrue(loaded.has_value() && *loaded == bytes, QStringLiteral("loadFile returns saved bytes"));
    expectTrue(hexgrid::ByteFileIo::isWritable(filePath), QStringLiteral("temp file is writable"));
    expectTrue(!hexgrid::ByteFileIo::loadFile(filePath + QStringLiteral(".missing")).has_value(),
               QStringLiteral("missing file fails to load"));
}

}  // namespace

int main(int argc, char** argv) {
    qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
    QApplication app(argc, argv);

    testDynamicByteStore();
    testChangeTracker();
    testKeyBindings();
    testByteCharConverters();
    testClipboardCodec();
    testScrollController();
    testGridGeometryHitTesting();
    testGridGeometryRoundTrip();
    testFindEngine();
    testFindBlocksMutation();
    testHexEntryOverwriteAndInsert();
    testCharEntryReplacesSelection();
    testReadOnlyConsumesInput();
    testDeleteKeys();
    testNavigation();
    testShiftSelectionIsSymmetric();
    testClipboardOperations();
    testDeleteInsertRoundTrip();
    testEngineFind();
    testNotifyAfterCommand();
    testStoreSwap();
    testExternalMutationClampsCursor();
    testByteFileIo();

    if (g_failures == 0) {
        qInfo() << "All unit tests passed";
        return 0;
    }

    qCritical() << g_failures << "unit test(s) failed";
    return 1;
}
