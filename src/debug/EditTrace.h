#pragma once

#include <chrono>
#include <iostream>

#include <QByteArray>
#include <QString>
#include <QThread>
#include <QtGlobal>

namespace hexgrid::debug {

// HEXGRID_EDITTRACE=1 (or any value except 0/false/off/no) turns tracing on.
inline bool editTraceEnabled() {
    static const bool enabled = []() {
        if (!qEnvironmentVariableIsSet("HEXGRID_EDITTRACE")) {
            return false;
        }
        const QByteArray value = qgetenv("HEXGRID_EDITTRACE").trimmed().toLower();
        return !(value == "0" || value == "false" || value == "off" || value == "no");
    }();
    return enabled;
}

// Each line carries the time since the first trace and the calling thread.
inline void editTraceLog(const QString& message) {
    if (!editTraceEnabled()) {
        return;
    }
    static const auto start = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    const quintptr threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());
    std::cout << "[edittrace +" << elapsed.count() << "us t=0x" << std::hex << threadId
              << std::dec << "] " << message.toStdString() << std::endl;
}

}  // namespace hexgrid::debug

#define HEXGRID_EDITTRACE(MSG) ::hexgrid::debug::editTraceLog(QString(MSG))
