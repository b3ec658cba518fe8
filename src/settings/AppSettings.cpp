#include "settings/AppSettings.h"

#include <QDir>
#include <QSettings>

namespace hexgrid {

namespace {
constexpr const char* kOrg = "hexgrid";
constexpr const char* kApp = "hexgrid";
constexpr const char* kLastFilePathKey = "ui/lastFileDialogPath";
constexpr const char* kMainWindowGeometryKey = "ui/mainWindowGeometry";
constexpr const char* kBytesPerLineKey = "ui/bytesPerLine";
constexpr const char* kFixedBytesPerLineKey = "ui/fixedBytesPerLine";
constexpr const char* kGroupSizeKey = "ui/groupSize";
constexpr const char* kHexLowerCaseKey = "ui/hexLowerCase";
constexpr const char* kCharPaneVisibleKey = "ui/charPaneVisible";
constexpr const char* kLineInfoVisibleKey = "ui/lineInfoVisible";
constexpr const char* kColumnInfoVisibleKey = "ui/columnInfoVisible";
constexpr const char* kGroupSeparatorVisibleKey = "ui/groupSeparatorVisible";
constexpr const char* kEncodingNameKey = "ui/encodingName";
constexpr const char* kReadOnlyKey = "edit/readOnly";
constexpr const char* kCutEnabledKey = "edit/cutEnabled";
constexpr const char* kDeleteEnabledKey = "edit/deleteEnabled";
constexpr const char* kPasteEnabledKey = "edit/pasteEnabled";
constexpr const char* kOverwritePasteKey = "edit/overwritePaste";
constexpr const char* kRetainDirtyKey = "edit/retainDirtyOnSwap";
constexpr const char* kRetainCommittedKey = "edit/retainCommittedOnSwap";
constexpr const char* kAutoCommitKey = "edit/autoCommitOnSwap";
constexpr const char* kCopyKeyAsHexKey = "edit/copyKeyAsHex";

constexpr int kDefaultBytesPerLine = 16;
constexpr int kDefaultGroupSize = 4;
}  // namespace

QString AppSettings::lastFileDialogPath() {
    QSettings settings(kOrg, kApp);
    return settings.value(kLastFilePathKey, QDir::homePath()).toString();
}

void AppSettings::setLastFileDialogPath(const QString& path) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kLastFilePathKey, path);
}

QByteArray AppSettings::mainWindowGeometry() {
    QSettings settings(kOrg, kApp);
    return settings.value(kMainWindowGeometryKey).toByteArray();
}

void AppSettings::setMainWindowGeometry(const QByteArray& geometry) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kMainWindowGeometryKey, geometry);
}

int AppSettings::bytesPerLine() {
    QSettings settings(kOrg, kApp);
    return qMax(1, settings.value(kBytesPerLineKey, kDefaultBytesPerLine).toInt());
}

bool AppSettings::fixedBytesPerLineEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kFixedBytesPerLineKey, true).toBool();
}

int AppSettings::groupSize() {
    QSettings settings(kOrg, kApp);
    return qMax(1, settings.value(kGroupSizeKey, kDefaultGroupSize).toInt());
}

bool AppSettings::hexLowerCaseEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kHexLowerCaseKey, false).toBool();
}

bool AppSettings::charPaneVisible() {
    QSettings settings(kOrg, kApp);
    return settings.value(kCharPaneVisibleKey, true).toBool();
}

bool AppSettings::lineInfoVisible() {
    QSettings settings(kOrg, kApp);
    return settings.value(kLineInfoVisibleKey, true).toBool();
}

bool AppSettings::columnInfoVisible() {
    QSettings settings(kOrg, kApp);
    return settings.value(kColumnInfoVisibleKey, true).toBool();
}

bool AppSettings::groupSeparatorVisible() {
    QSettings settings(kOrg, kApp);
    return settings.value(kGroupSeparatorVisibleKey, true).toBool();
}

bool AppSettings::readOnlyEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kReadOnlyKey, false).toBool();
}

bool AppSettings::cutEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kCutEnabledKey, true).toBool();
}

bool AppSettings::deleteEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kDeleteEnabledKey, true).toBool();
}

bool AppSettings::pasteEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kPasteEnabledKey, true).toBool();
}

bool AppSettings::overwritePasteEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kOverwritePasteKey, false).toBool();
}

bool AppSettings::retainDirtyOnSwapEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kRetainDirtyKey, false).toBool();
}

bool AppSettings::retainCommittedOnSwapEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kRetainCommittedKey, false).toBool();
}

bool AppSettings::autoCommitOnSwapEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kAutoCommitKey, false).toBool();
}

bool AppSettings::copyKeyAsHexEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kCopyKeyAsHexKey, false).toBool();
}

QString AppSettings::encodingName() {
    QSettings settings(kOrg, kApp);
    return settings.value(kEncodingNameKey, QString()).toString();
}

void AppSettings::setHexLowerCaseEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kHexLowerCaseKey, enabled);
}

void AppSettings::setCharPaneVisible(bool visible) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kCharPaneVisibleKey, visible);
}

void AppSettings::setLineInfoVisible(bool visible) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kLineInfoVisibleKey, visible);
}

void AppSettings::setColumnInfoVisible(bool visible) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kColumnInfoVisibleKey, visible);
}

void AppSettings::setGroupSeparatorVisible(bool visible) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kGroupSeparatorVisibleKey, visible);
}

void AppSettings::setReadOnlyEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kReadOnlyKey, enabled);
}

void AppSettings::setOverwritePasteEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kOverwritePasteKey, enabled);
}

void AppSettings::setEncodingName(const QString& name) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kEncodingNameKey, name);
}

EditOptions AppSettings::editOptions() {
    EditOptions options;
    options.readOnly = readOnlyEnabled();
    options.enableCut = cutEnabled();
    options.enableDelete = deleteEnabled();
    options.enablePaste = pasteEnabled();
    options.enableOverwritePaste = overwritePasteEnabled();
    options.retainDirtyOnSwap = retainDirtyOnSwapEnabled();
    options.retainCommittedOnSwap = retainCommittedOnSwapEnabled();
    options.autoCommitOnSwap = autoCommitOnSwapEnabled();
    options.hexLowerCase = hexLowerCaseEnabled();
    options.copyKeyAsHex = copyKeyAsHexEnabled();
    options.layout.bytesPerLine = bytesPerLine();
    options.layout.fixedBytesPerLine = fixedBytesPerLineEnabled();
    options.layout.groupSize = groupSize();
    options.layout.charPaneVisible = charPaneVisible();
    options.layout.lineInfoVisible = lineInfoVisible();
    options.layout.columnInfoVisible = columnInfoVisible();
    return options;
}

}  // namespace hexgrid
