#pragma once

#include <QByteArray>
#include <QChar>
#include <QString>
#include <QtGlobal>

namespace hexgrid {

struct CaseFoldedPattern {
    QByteArray lower;
    QByteArray upper;
};

class ByteCharConverter {
public:
    virtual ~ByteCharConverter() = default;

    virtual QChar byteToChar(quint8 byte) const = 0;
    // One output character per input byte.
    virtual QString bytesToDisplayString(const QByteArray& bytes) const = 0;
    virtual quint8 charToByte(QChar ch) const = 0;
    virtual QByteArray encodeText(const QString& text) const = 0;
    virtual QString name() const = 0;

    // Lower/upper encodings of a find pattern; equal length when usable for
    // case-insensitive search, otherwise both empty.
    CaseFoldedPattern encodeForSearch(const QString& text) const;

    static constexpr QChar kFiller = QLatin1Char('.');
};

class DefaultByteCharConverter : public ByteCharConverter {
public:
    QChar byteToChar(quint8 byte) const override;
    QString bytesToDisplayString(const QByteArray& bytes) const override;
    quint8 charToByte(QChar ch) const override;
    QByteArray encodeText(const QString& text) const override;
    QString name() const override;
};

// Text encoding looked up by name (UTF-8, UTF-16LE, ISO-8859-1, ...). Falls back
// to the default mapping when the name is unknown.
class CodecByteCharConverter : public ByteCharConverter {
public:
    explicit CodecByteCharConverter(const QString& encodingName);

    bool isValid() const;

    QChar byteToChar(quint8 byte) const override;
    QString bytesToDisplayString(const QByteArray& bytes) const override;
    quint8 charToByte(QChar ch) const override;
    QByteArray encodeText(const QString& text) const override;
    QString name() const override;

private:
    QString m_encodingName;
    bool m_valid = false;
    DefaultByteCharConverter m_fallback;
};

}  // namespace hexgrid
