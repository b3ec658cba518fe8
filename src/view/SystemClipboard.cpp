#include "view/SystemClipboard.h"

#include <QClipboard>
#include <QGuiApplication>
#include <QMimeData>

namespace hexgrid {

namespace {
const QMimeData* currentMimeData() {
    QClipboard* clipboard = QGuiApplication::clipboard();
    return clipboard != nullptr ? clipboard->mimeData() : nullptr;
}
}  // namespace

void SystemClipboard::setPayload(const CopyPayload& payload) {
    QClipboard* clipboard = QGuiApplication::clipboard();
    if (clipboard == nullptr) {
        return;
    }
    auto* mime = new QMimeData();
    mime->setText(payload.text());
    mime->setData(QString::fromLatin1(kRawBytesMimeType), payload.bytes);
    clipboard->setMimeData(mime);
}

bool SystemClipboard::hasRawBytes() const {
    const QMimeData* mime = currentMimeData();
    return mime != nullptr && mime->hasFormat(QString::fromLatin1(kRawBytesMimeType));
}

QByteArray SystemClipboard::rawBytes() const {
    const QMimeData* mime = currentMimeData();
    if (mime == nullptr) {
        return {};
    }
    return mime->data(QString::fromLatin1(kRawBytesMimeType));
}

bool SystemClipboard::hasText() const {
    const QMimeData* mime = currentMimeData();
    return mime != nullptr && mime->hasText();
}

QString SystemClipboard::text() const {
    const QMimeData* mime = currentMimeData();
    return mime != nullptr ? mime->text() : QString();
}

}  // namespace hexgrid
