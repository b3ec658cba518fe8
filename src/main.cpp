#include <QApplication>
#include <QElapsedTimer>
#include <QEvent>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include "app/MainWindow.h"
#include "debug/EditTrace.h"

namespace {

int eventTraceSlowThresholdMs() {
    static const int value = []() {
        bool ok = false;
        const int parsed = qEnvironmentVariableIntValue("HEXGRID_EVENTTRACE_SLOW_MS", &ok);
        if (!ok || parsed <= 0) {
            return 50;
        }
        return parsed;
    }();
    return value;
}

const char* eventTypeName(QEvent::Type type) {
    switch (type) {
        case QEvent::MouseButtonPress:
            return "MouseButtonPress";
        case QEvent::MouseButtonRelease:
            return "MouseButtonRelease";
        case QEvent::MouseMove:
            return "MouseMove";
        case QEvent::Wheel:
            return "Wheel";
        case QEvent::KeyPress:
            return "KeyPress";
        case QEvent::ShortcutOverride:
            return "ShortcutOverride";
        case QEvent::Paint:
            return "Paint";
        case QEvent::Resize:
            return "Resize";
        case QEvent::MetaCall:
            return "MetaCall";
        default:
            return "Other";
    }
}

// Logs events whose handling exceeds HEXGRID_EVENTTRACE_SLOW_MS while edit
// tracing is enabled. A running find shows up here as one long event.
class HexgridApplication : public QApplication {
public:
    using QApplication::QApplication;

    bool notify(QObject* receiver, QEvent* event) override {
        if (!hexgrid::debug::editTraceEnabled()) {
            return QApplication::notify(receiver, event);
        }

        QElapsedTimer timer;
        timer.start();
        const QString receiverClass =
            (receiver != nullptr && receiver->metaObject() != nullptr)
                ? QString::fromLatin1(receiver->metaObject()->className())
                : QStringLiteral("-");
        const int eventType = (event != nullptr) ? static_cast<int>(event->type()) : -1;
        const char* eventName = (event != nullptr) ? eventTypeName(event->type()) : "null";

        const bool handled = QApplication::notify(receiver, event);

        const qint64 elapsedUs = timer.nsecsElapsed() / 1000;
        if (elapsedUs >= static_cast<qint64>(eventTraceSlowThresholdMs()) * 1000) {
            HEXGRID_EDITTRACE(QStringLiteral("event slow-finish: receiver=%1 event=%2(%3) elapsed=%4us")
                                  .arg(receiverClass)
                                  .arg(QString::fromLatin1(eventName))
                                  .arg(eventType)
                                  .arg(elapsedUs));
        }
        return handled;
    }
};

}  // namespace

int main(int argc, char* argv[]) {
    HexgridApplication app(argc, argv);
    QApplication::setOrganizationName(QStringLiteral("hexgrid"));
    QApplication::setApplicationName(QStringLiteral("hexgrid"));

    hexgrid::MainWindow window;
    const QStringList args = app.arguments();
    if (args.size() >= 2) {
        window.openFile(args.at(1));
    }
    window.show();
    return app.exec();
}
