#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace hexgrid {

class ByteCharConverter;

// Both textual forms of a copied byte range. text is what the host puts on the
// clipboard as plain text; bytes travel alongside as raw binary data.
struct CopyPayload {
    QByteArray bytes;
    QString charText;
    QString hexText;
    bool asHex = false;

    QString text() const { return asHex ? hexText : charText; }
};

// Bridge to whatever clipboard the host has.
class ClipboardAccess {
public:
    virtual ~ClipboardAccess() = default;

    virtual void setPayload(const CopyPayload& payload) = 0;
    virtual bool hasRawBytes() const = 0;
    virtual QByteArray rawBytes() const = 0;
    virtual bool hasText() const = 0;
    virtual QString text() const = 0;
};

// In-process clipboard used by headless hosts and tests.
class MemoryClipboard : public ClipboardAccess {
public:
    void setPayload(const CopyPayload& payload) override;
    bool hasRawBytes() const override;
    QByteArray rawBytes() const override;
    bool hasText() const override;
    QString text() const override;

    void setText(const QString& text);
    void setRawBytes(const QByteArray& bytes);
    void clear();

private:
    std::optional<QByteArray> m_bytes;
    std::optional<QString> m_text;
};

class ClipboardCodec {
public:
    // Two hex digits per byte, no separators.
    static QString toHexText(const QByteArray& bytes, bool lowerCase);

    // Strips ' ', '-' and '_', left-pads an odd digit count with '0' and
    // decodes digit pairs. Text without digits or with any non-hex pair is
    // rejected.
    static std::optional<QByteArray> parseHexText(const QString& text);

    static CopyPayload makePayload(const QByteArray& bytes, const ByteCharConverter& converter,
                                   bool asHex, bool lowerCase);
};

}  // namespace hexgrid
