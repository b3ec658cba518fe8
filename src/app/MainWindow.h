#pragma once

#include <QMainWindow>
#include <QString>
#include <QTimer>
#include <functional>
#include <memory>

#include "edit/EditorState.h"
#include "find/FindEngine.h"
#include "store/DynamicByteStore.h"

QT_BEGIN_NAMESPACE
class QLabel;
namespace Ui {
class MainWindow;
}
QT_END_NAMESPACE

namespace hexgrid {

class FindPanel;
class HexGridWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    bool openFile(const QString& filePath);
    HexGridWidget* gridWidget() const;

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onOpenFile();
    bool onSave();
    bool onSaveAs();
    void onFind(FindDirection direction);
    void onGoTo();
    void onChooseEncoding();
    void onContentChanged();

private:
    void connectActions();
    void applySettingsToActions();
    void updateOption(const std::function<void(EditOptions&)>& change);
    bool saveTo(const QString& filePath);
    bool confirmDiscardChanges();
    bool isModified() const;
    void showFindPanel();
    void refreshActions();
    void refreshStatusBar();
    void refreshWindowTitle();

    std::unique_ptr<Ui::MainWindow> m_ui;
    std::unique_ptr<DynamicByteStore> m_store;
    HexGridWidget* m_grid = nullptr;
    FindPanel* m_findPanel = nullptr;
    QLabel* m_positionLabel = nullptr;
    QLabel* m_selectionLabel = nullptr;
    QLabel* m_insertLabel = nullptr;
    QLabel* m_lengthLabel = nullptr;
    QTimer m_findProgressTimer;
    bool m_findActive = false;
    QString m_filePath;
};

}  // namespace hexgrid
