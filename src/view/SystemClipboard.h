#pragma once

#include "edit/ClipboardCodec.h"

namespace hexgrid {

// Engine clipboard backed by QGuiApplication::clipboard(). Copies carry the
// text form plus the raw bytes under kRawBytesMimeType.
class SystemClipboard : public ClipboardAccess {
public:
    static constexpr const char* kRawBytesMimeType = "application/octet-stream";

    void setPayload(const CopyPayload& payload) override;
    bool hasRawBytes() const override;
    QByteArray rawBytes() const override;
    bool hasText() const override;
    QString text() const override;
};

}  // namespace hexgrid
