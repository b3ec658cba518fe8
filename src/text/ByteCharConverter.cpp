#include "text/ByteCharConverter.h"

#include <QStringDecoder>
#include <QStringEncoder>

namespace hexgrid {

namespace {
constexpr char16_t kReplacementChar = 0xFFFD;

bool isDisplayable(QChar ch) {
    return !ch.isNull() && ch.unicode() != kReplacementChar && !ch.isSurrogate() && ch.isPrint();
}

QChar displayCharOrFiller(QChar ch) {
    return isDisplayable(ch) ? ch : ByteCharConverter::kFiller;
}
}  // namespace

CaseFoldedPattern ByteCharConverter::encodeForSearch(const QString& text) const {
    CaseFoldedPattern pattern;
    pattern.lower = encodeText(text.toLower());
    pattern.upper = encodeText(text.toUpper());
    if (pattern.lower.size() != pattern.upper.size()) {
        return {};
    }
    return pattern;
}

QChar DefaultByteCharConverter::byteToChar(quint8 byte) const {
    if (byte <= 0x1F || (byte >= 0x7F && byte <= 0x9F)) {
        return kFiller;
    }
    return QChar(static_cast<char16_t>(byte));
}

QString DefaultByteCharConverter::bytesToDisplayString(const QByteArray& bytes) const {
    QString out;
    out.reserve(bytes.size());
    for (const char b : bytes) {
        out.append(byteToChar(static_cast<quint8>(b)));
    }
    return out;
}

quint8 DefaultByteCharConverter::charToByte(QChar ch) const {
    if (ch.unicode() > 0xFF) {
        return static_cast<quint8>('?');
    }
    return static_cast<quint8>(ch.unicode());
}

QByteArray DefaultByteCharConverter::encodeText(const QString& text) const {
    QByteArray out;
    out.reserve(text.size());
    for (const QChar ch : text) {
        out.append(static_cast<char>(charToByte(ch)));
    }
    return out;
}

QString DefaultByteCharConverter::name() const { return QStringLiteral("ANSI (Default)"); }

CodecByteCharConverter::CodecByteCharConverter(const QString& encodingName)
    : m_encodingName(encodingName) {
    const QByteArray encoded = encodingName.toLatin1();
    QStringDecoder decoder(encoded.constData());
    m_valid = decoder.isValid();
}

bool CodecByteCharConverter::isValid() const { return m_valid; }

QChar CodecByteCharConverter::byteToChar(quint8 byte) const {
    if (!m_valid) {
        return m_fallback.byteToChar(byte);
    }
    const QByteArray encoded = m_encodingName.toLatin1();
    QStringDecoder decoder(encoded.constData());
    const char raw = static_cast<char>(byte);
    const QString decoded = decoder.decode(QByteArrayView(&raw, 1));
    if (decoded.size() != 1) {
        return kFiller;
    }
    return displayCharOrFiller(decoded.at(0));
}

QString CodecByteCharConverter::bytesToDisplayString(const QByteArray& bytes) const {
    if (!m_valid) {
        return m_fallback.bytesToDisplayString(bytes);
    }

    QString out(bytes.size(), kFiller);
    const QByteArray encoded = m_encodingName.toLatin1();
    QStringDecoder decoder(encoded.constData());
    qsizetype sequenceStart = 0;
    for (qsizetype i = 0; i < bytes.size(); ++i) {
        const QString piece = decoder.decode(QByteArrayView(bytes.constData() + i, 1));
        if (piece.isEmpty()) {
            continue;
        }
        const bool singleGlyph =
            piece.size() == 1 || (piece.size() == 2 && piece.at(0).isHighSurrogate());
        if (singleGlyph) {
            out[sequenceStart] = displayCharOrFiller(piece.at(0));
        } else {
            // An invalid pending sequence was flushed together with the
            // character completed by this byte.
            out[i] = displayCharOrFiller(piece.at(piece.size() - 1));
        }
        sequenceStart = i + 1;
    }
    return out;
}

quint8 CodecByteCharConverter::charToByte(QChar ch) const {
    if (!m_valid) {
        return m_fallback.charToByte(ch);
    }
    const QByteArray encoded = encodeText(QString(ch));
    if (encoded.isEmpty()) {
        return 0;
    }
    return static_cast<quint8>(encoded.at(0));
}

QByteArray CodecByteCharConverter::encodeText(const QString& text) const {
    if (!m_valid) {
        return m_fallback.encodeText(text);
    }
    const QByteArray encoded = m_encodingName.toLatin1();
    QStringEncoder encoder(encoded.constData());
    return encoder.encode(text);
}

QString CodecByteCharConverter::name() const { return m_encodingName; }

}  // namespace hexgrid
