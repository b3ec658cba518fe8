#include "edit/ClipboardCodec.h"

#include "text/ByteCharConverter.h"

namespace hexgrid {

namespace {
int hexDigitValue(QChar ch) {
    const char16_t c = ch.unicode();
    if (c >= u'0' && c <= u'9') {
        return c - u'0';
    }
    if (c >= u'a' && c <= u'f') {
        return c - u'a' + 10;
    }
    if (c >= u'A' && c <= u'F') {
        return c - u'A' + 10;
    }
    return -1;
}
}  // namespace

void MemoryClipboard::setPayload(const CopyPayload& payload) {
    m_bytes = payload.bytes;
    m_text = payload.text();
}

bool MemoryClipboard::hasRawBytes() const { return m_bytes.has_value(); }

QByteArray MemoryClipboard::rawBytes() const { return m_bytes.value_or(QByteArray()); }

bool MemoryClipboard::hasText() const { return m_text.has_value(); }

QString MemoryClipboard::text() const { return m_text.value_or(QString()); }

void MemoryClipboard::setText(const QString& text) {
    m_text = text;
    m_bytes.reset();
}

void MemoryClipboard::setRawBytes(const QByteArray& bytes) { m_bytes = bytes; }

void MemoryClipboard::clear() {
    m_bytes.reset();
    m_text.reset();
}

QString ClipboardCodec::toHexText(const QByteArray& bytes, bool lowerCase) {
    const QByteArray hex = bytes.toHex();
    return lowerCase ? QString::fromLatin1(hex) : QString::fromLatin1(hex).toUpper();
}

std::optional<QByteArray> ClipboardCodec::parseHexText(const QString& text) {
    QString digits;
    digits.reserve(text.size());
    for (const QChar ch : text) {
        if (ch == QLatin1Char(' ') || ch == QLatin1Char('-') || ch == QLatin1Char('_')) {
            continue;
        }
        digits.append(ch);
    }
    if (digits.isEmpty()) {
        return std::nullopt;
    }
    if (digits.size() % 2 == 1) {
        digits.prepend(QLatin1Char('0'));
    }

    QByteArray out;
    out.reserve(digits.size() / 2);
    for (qsizetype i = 0; i + 1 < digits.size(); i += 2) {
        const int high = hexDigitValue(digits.at(i));
        const int low = hexDigitValue(digits.at(i + 1));
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.append(static_cast<char>((high << 4) | low));
    }
    return out;
}

CopyPayload ClipboardCodec::makePayload(const QByteArray& bytes, const ByteCharConverter& converter,
                                        bool asHex, bool lowerCase) {
    CopyPayload payload;
    payload.bytes = bytes;
    payload.charText = converter.bytesToDisplayString(bytes);
    payload.hexText = toHexText(bytes, lowerCase);
    payload.asHex = asHex;
    return payload;
}

}  // namespace hexgrid
