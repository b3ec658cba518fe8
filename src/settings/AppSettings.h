#pragma once

#include <QByteArray>
#include <QString>

#include "edit/EditorState.h"

namespace hexgrid {

class AppSettings {
public:
    static QString lastFileDialogPath();
    static void setLastFileDialogPath(const QString& path);
    static QByteArray mainWindowGeometry();
    static void setMainWindowGeometry(const QByteArray& geometry);

    static int bytesPerLine();
    static bool fixedBytesPerLineEnabled();
    static int groupSize();
    static bool hexLowerCaseEnabled();
    static bool charPaneVisible();
    static bool lineInfoVisible();
    static bool columnInfoVisible();
    static bool groupSeparatorVisible();
    static bool readOnlyEnabled();
    static bool cutEnabled();
    static bool deleteEnabled();
    static bool pasteEnabled();
    static bool overwritePasteEnabled();
    static bool retainDirtyOnSwapEnabled();
    static bool retainCommittedOnSwapEnabled();
    static bool autoCommitOnSwapEnabled();
    static bool copyKeyAsHexEnabled();
    static QString encodingName();

    static void setHexLowerCaseEnabled(bool enabled);
    static void setCharPaneVisible(bool visible);
    static void setLineInfoVisible(bool visible);
    static void setColumnInfoVisible(bool visible);
    static void setGroupSeparatorVisible(bool visible);
    static void setReadOnlyEnabled(bool enabled);
    static void setOverwritePasteEnabled(bool enabled);
    static void setEncodingName(const QString& name);

    // Engine options assembled from the keys above. Layout and edit
    // permission keys have no menu entry and are only read.
    static EditOptions editOptions();
};

}  // namespace hexgrid
