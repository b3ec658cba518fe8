#include "app/MainWindow.h"

#include <QAction>
#include <QClipboard>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGuiApplication>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QVBoxLayout>
#include <stdexcept>

#include "io/ByteFileIo.h"
#include "panel/FindPanel.h"
#include "settings/AppSettings.h"
#include "text/ByteCharConverter.h"
#include "ui_MainWindow.h"
#include "view/HexGridWidget.h"

namespace hexgrid {

namespace {
constexpr int kFindProgressIntervalMs = 100;

QString formatOffset(qint64 offset) {
    return QStringLiteral("0x%1").arg(QString::number(offset, 16).toUpper());
}

std::shared_ptr<const ByteCharConverter> converterForName(const QString& name) {
    if (name.isEmpty()) {
        return std::make_shared<DefaultByteCharConverter>();
    }
    auto converter = std::make_shared<CodecByteCharConverter>(name);
    if (!converter->isValid()) {
        qWarning() << "Unknown text encoding" << name << "- using the default mapping";
    }
    return converter;
}
}  // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent), m_ui(std::make_unique<Ui::MainWindow>()) {
    m_ui->setupUi(this);

    auto* findHostLayout = new QVBoxLayout(m_ui->findPanelHost);
    findHostLayout->setContentsMargins(0, 0, 0, 0);
    m_findPanel = new FindPanel(m_ui->findPanelHost);
    findHostLayout->addWidget(m_findPanel);
    m_ui->findPanelHost->setVisible(false);

    auto* gridHostLayout = new QVBoxLayout(m_ui->gridHost);
    gridHostLayout->setContentsMargins(0, 0, 0, 0);
    m_grid = new HexGridWidget(m_ui->gridHost);
    gridHostLayout->addWidget(m_grid);

    m_positionLabel = new QLabel(this);
    m_selectionLabel = new QLabel(this);
    m_insertLabel = new QLabel(this);
    m_lengthLabel = new QLabel(this);
    statusBar()->addWidget(m_positionLabel);
    statusBar()->addWidget(m_selectionLabel, 1);
    statusBar()->addPermanentWidget(m_insertLabel);
    statusBar()->addPermanentWidget(m_lengthLabel);

    HexEditEngine& engine = m_grid->engine();
    engine.setOptions(AppSettings::editOptions());
    engine.setConverter(converterForName(AppSettings::encodingName()));
    m_grid->setGroupSeparatorVisible(AppSettings::groupSeparatorVisible());

    m_findProgressTimer.setInterval(kFindProgressIntervalMs);
    connect(&m_findProgressTimer, &QTimer::timeout, this, [this]() {
        m_findPanel->setStatusText(
            tr("Searching %1").arg(formatOffset(m_grid->engine().currentFindingPosition())));
    });

    connectActions();
    applySettingsToActions();

    const QByteArray geometry = AppSettings::mainWindowGeometry();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }

    refreshActions();
    refreshStatusBar();
    refreshWindowTitle();
}

MainWindow::~MainWindow() {
    // The engine must let go of the store before it is destroyed.
    m_grid->engine().setByteStore(nullptr);
}

bool MainWindow::openFile(const QString& filePath) {
    if (m_grid->engine().isFindRunning()) {
        return false;
    }
    const std::optional<QByteArray> bytes = ByteFileIo::loadFile(filePath);
    if (!bytes.has_value()) {
        QMessageBox::warning(this, QStringLiteral("hexgrid"),
                             tr("Could not open %1").arg(QDir::toNativeSeparators(filePath)));
        return false;
    }

    auto store = std::make_unique<DynamicByteStore>(bytes.value());
    connect(store.get(), &ByteStore::contentChanged, this, &MainWindow::onContentChanged);
    connect(store.get(), &ByteStore::lengthChanged, this, &MainWindow::onContentChanged);

    HexEditEngine& engine = m_grid->engine();
    if (!engine.setByteStore(store.get())) {
        qWarning() << "Open refused while a find is running:" << filePath;
        return false;
    }
    m_store = std::move(store);
    m_filePath = filePath;

    EditOptions options = engine.options();
    options.readOnly = AppSettings::readOnlyEnabled() || !ByteFileIo::isWritable(filePath);
    engine.setOptions(options);

    m_grid->setFocus(Qt::OtherFocusReason);
    refreshActions();
    refreshStatusBar();
    refreshWindowTitle();
    return true;
}

HexGridWidget* MainWindow::gridWidget() const { return m_grid; }

void MainWindow::closeEvent(QCloseEvent* event) {
    HexEditEngine& engine = m_grid->engine();
    if (engine.isFindRunning()) {
        engine.abortFind();
        event->ignore();
        return;
    }
    if (!confirmDiscardChanges()) {
        event->ignore();
        return;
    }
    AppSettings::setMainWindowGeometry(saveGeometry());
    event->accept();
}

void MainWindow::onOpenFile() {
    if (m_grid->engine().isFindRunning() || !confirmDiscardChanges()) {
        return;
    }
    const QString filePath = QFileDialog::getOpenFileName(this, tr("Open file"),
                                                          AppSettings::lastFileDialogPath());
    if (filePath.isEmpty()) {
        return;
    }
    AppSettings::setLastFileDialogPath(filePath);
    openFile(filePath);
}

bool MainWindow::onSave() {
    if (m_store == nullptr) {
        return false;
    }
    if (m_filePath.isEmpty()) {
        return onSaveAs();
    }
    return saveTo(m_filePath);
}

bool MainWindow::onSaveAs() {
    if (m_store == nullptr) {
        return false;
    }
    const QString start = m_filePath.isEmpty() ? AppSettings::lastFileDialogPath() : m_filePath;
    const QString filePath = QFileDialog::getSaveFileName(this, tr("Save file as"), start);
    if (filePath.isEmpty()) {
        return false;
    }
    AppSettings::setLastFileDialogPath(filePath);
    if (!saveTo(filePath)) {
        return false;
    }
    m_filePath = filePath;
    refreshWindowTitle();
    return true;
}

void MainWindow::onFind(FindDirection direction) {
    HexEditEngine& engine = m_grid->engine();
    if (m_store == nullptr || engine.isFindRunning()) {
        return;
    }
    showFindPanel();

    const FindOptions options = m_findPanel->findOptions(direction);
    if (options.kind == FindPatternKind::Hex && options.hexBytes.isEmpty()) {
        m_findPanel->setStatusText(tr("Invalid hex pattern"));
        return;
    }
    if (options.kind == FindPatternKind::Text && options.text.isEmpty()) {
        m_findPanel->setStatusText(tr("Nothing to find"));
        return;
    }

    m_findPanel->setFindRunning(true);
    m_findProgressTimer.start();
    // Disables the editing actions; isFindRunning() turns true inside find().
    m_findActive = true;
    refreshActions();
    qint64 found = kFindNotFound;
    bool rejected = false;
    try {
        found = engine.find(options);
    } catch (const std::invalid_argument& error) {
        qWarning() << "Find rejected:" << error.what();
        rejected = true;
    }
    m_findActive = false;
    m_findProgressTimer.stop();
    m_findPanel->setFindRunning(false);
    refreshActions();
    if (rejected) {
        m_findPanel->setStatusText(tr("Pattern cannot be searched with this encoding"));
        return;
    }

    if (found >= 0) {
        m_findPanel->setStatusText(tr("Found at %1").arg(formatOffset(found)));
        m_grid->setFocus(Qt::OtherFocusReason);
    } else if (found == kFindAborted) {
        m_findPanel->setStatusText(tr("Cancelled"));
    } else {
        m_findPanel->setStatusText(tr("Not found"));
    }
}

void MainWindow::onGoTo() {
    HexEditEngine& engine = m_grid->engine();
    if (m_store == nullptr || engine.isFindRunning()) {
        return;
    }
    bool accepted = false;
    const QString text = QInputDialog::getText(
        this, tr("Go To"), tr("Offset (decimal or 0x-prefixed hex):"), QLineEdit::Normal,
        formatOffset(engine.selectionStart()), &accepted);
    if (!accepted) {
        return;
    }
    bool ok = false;
    const qint64 offset = text.trimmed().toLongLong(&ok, 0);
    if (!ok || offset < 0 || offset > engine.length()) {
        QMessageBox::information(this, QStringLiteral("hexgrid"),
                                 tr("%1 is not an offset in this file").arg(text));
        return;
    }
    engine.goTo(offset);
}

void MainWindow::onChooseEncoding() {
    if (m_grid->engine().isFindRunning()) {
        return;
    }
    const QStringList encodings = {tr("Default"),  QStringLiteral("UTF-8"),
                                   QStringLiteral("UTF-16LE"), QStringLiteral("UTF-16BE"),
                                   QStringLiteral("ISO-8859-1")};
    const QString current = AppSettings::encodingName();
    const int currentIndex = current.isEmpty() ? 0 : qMax(0, encodings.indexOf(current));
    bool accepted = false;
    const QString choice = QInputDialog::getItem(this, tr("Encoding"), tr("Character pane:"),
                                                 encodings, currentIndex, false, &accepted);
    if (!accepted) {
        return;
    }
    const QString name = choice == encodings.first() ? QString() : choice;
    AppSettings::setEncodingName(name);
    m_grid->engine().setConverter(converterForName(name));
}

void MainWindow::onContentChanged() {
    refreshWindowTitle();
    refreshStatusBar();
}

void MainWindow::connectActions() {
    HexEditEngine& engine = m_grid->engine();

    connect(m_ui->actionOpen, &QAction::triggered, this, &MainWindow::onOpenFile);
    connect(m_ui->actionSave, &QAction::triggered, this, &MainWindow::onSave);
    connect(m_ui->actionSaveAs, &QAction::triggered, this, &MainWindow::onSaveAs);
    connect(m_ui->actionExit, &QAction::triggered, this, &QWidget::close);

    connect(m_ui->actionCut, &QAction::triggered, this, [&engine]() { engine.cut(); });
    connect(m_ui->actionCopy, &QAction::triggered, this, [&engine]() { engine.copy(false); });
    connect(m_ui->actionCopyHex, &QAction::triggered, this, [&engine]() { engine.copy(true); });
    connect(m_ui->actionPaste, &QAction::triggered, this, [&engine]() { engine.paste(false); });
    connect(m_ui->actionPasteHex, &QAction::triggered, this,
            [&engine]() { engine.paste(true); });
    connect(m_ui->actionSelectAll, &QAction::triggered, this, [&engine]() { engine.selectAll(); });
    connect(m_ui->actionFind, &QAction::triggered, this, &MainWindow::showFindPanel);
    connect(m_ui->actionFindNext, &QAction::triggered, this,
            [this]() { onFind(FindDirection::Forward); });
    connect(m_ui->actionFindPrevious, &QAction::triggered, this,
            [this]() { onFind(FindDirection::Backward); });
    connect(m_ui->actionGoTo, &QAction::triggered, this, &MainWindow::onGoTo);

    connect(m_ui->actionCharPane, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setCharPaneVisible(checked);
        updateOption([checked](EditOptions& options) { options.layout.charPaneVisible = checked; });
    });
    connect(m_ui->actionLineInfo, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setLineInfoVisible(checked);
        updateOption([checked](EditOptions& options) { options.layout.lineInfoVisible = checked; });
    });
    connect(m_ui->actionColumnInfo, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setColumnInfoVisible(checked);
        updateOption(
            [checked](EditOptions& options) { options.layout.columnInfoVisible = checked; });
    });
    connect(m_ui->actionGroupSeparators, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setGroupSeparatorVisible(checked);
        m_grid->setGroupSeparatorVisible(checked);
    });
    connect(m_ui->actionLowerCaseHex, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setHexLowerCaseEnabled(checked);
        updateOption([checked](EditOptions& options) { options.hexLowerCase = checked; });
    });
    connect(m_ui->actionEncoding, &QAction::triggered, this, &MainWindow::onChooseEncoding);

    connect(m_ui->actionReadOnly, &QAction::toggled, this, [this, &engine](bool checked) {
        AppSettings::setReadOnlyEnabled(checked);
        engine.setReadOnly(checked || (!m_filePath.isEmpty() && !ByteFileIo::isWritable(m_filePath)));
    });
    connect(m_ui->actionInsertMode, &QAction::toggled, this,
            [&engine](bool checked) { engine.setInsertActive(checked); });
    connect(m_ui->actionOverwritePaste, &QAction::toggled, this, [this](bool checked) {
        AppSettings::setOverwritePasteEnabled(checked);
        updateOption([checked](EditOptions& options) { options.enableOverwritePaste = checked; });
    });

    connect(m_findPanel, &FindPanel::findRequested, this, &MainWindow::onFind);
    connect(m_findPanel, &FindPanel::cancelRequested, this, [&engine]() { engine.abortFind(); });
    connect(m_findPanel, &FindPanel::closeRequested, this, [this]() {
        m_ui->findPanelHost->setVisible(false);
        m_grid->setFocus(Qt::OtherFocusReason);
    });

    connect(&engine, &HexEditEngine::selectionStartChanged, this, &MainWindow::refreshStatusBar);
    connect(&engine, &HexEditEngine::selectionLengthChanged, this, [this]() {
        refreshStatusBar();
        refreshActions();
    });
    connect(&engine, &HexEditEngine::currentLineChanged, this, &MainWindow::refreshStatusBar);
    connect(&engine, &HexEditEngine::currentPositionInLineChanged, this,
            &MainWindow::refreshStatusBar);
    connect(&engine, &HexEditEngine::insertActiveChanged, this, [this](bool active) {
        const QSignalBlocker blocker(m_ui->actionInsertMode);
        m_ui->actionInsertMode->setChecked(active);
        refreshStatusBar();
    });
    connect(&engine, &HexEditEngine::readOnlyChanged, this, &MainWindow::refreshActions);
    connect(&engine, &HexEditEngine::byteStoreChanged, this, &MainWindow::refreshActions);
    connect(&engine, &HexEditEngine::copied, this, &MainWindow::refreshActions);
    if (QClipboard* clipboard = QGuiApplication::clipboard()) {
        connect(clipboard, &QClipboard::dataChanged, this, &MainWindow::refreshActions);
    }
}

void MainWindow::applySettingsToActions() {
    const EditOptions& options = m_grid->engine().options();
    const auto setChecked = [](QAction* action, bool checked) {
        const QSignalBlocker blocker(action);
        action->setChecked(checked);
    };
    setChecked(m_ui->actionCharPane, options.layout.charPaneVisible);
    setChecked(m_ui->actionLineInfo, options.layout.lineInfoVisible);
    setChecked(m_ui->actionColumnInfo, options.layout.columnInfoVisible);
    setChecked(m_ui->actionGroupSeparators, m_grid->groupSeparatorVisible());
    setChecked(m_ui->actionLowerCaseHex, options.hexLowerCase);
    setChecked(m_ui->actionReadOnly, options.readOnly);
    setChecked(m_ui->actionInsertMode, m_grid->engine().isInsertActive());
    setChecked(m_ui->actionOverwritePaste, options.enableOverwritePaste);
}

void MainWindow::updateOption(const std::function<void(EditOptions&)>& change) {
    HexEditEngine& engine = m_grid->engine();
    EditOptions options = engine.options();
    change(options);
    engine.setOptions(options);
    refreshActions();
}

bool MainWindow::saveTo(const QString& filePath) {
    if (!ByteFileIo::saveFile(filePath, m_store->bytes())) {
        QMessageBox::warning(this, QStringLiteral("hexgrid"),
                             tr("Could not save %1").arg(QDir::toNativeSeparators(filePath)));
        return false;
    }
    m_store->applyChanges();
    m_grid->engine().commitChanges();
    refreshWindowTitle();
    return true;
}

bool MainWindow::confirmDiscardChanges() {
    if (!isModified()) {
        return true;
    }
    const QMessageBox::StandardButton answer = QMessageBox::question(
        this, QStringLiteral("hexgrid"),
        tr("%1 has unsaved changes. Save them?").arg(QFileInfo(m_filePath).fileName()),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel, QMessageBox::Save);
    if (answer == QMessageBox::Save) {
        return onSave();
    }
    return answer == QMessageBox::Discard;
}

bool MainWindow::isModified() const { return m_store != nullptr && m_store->hasChanges(); }

void MainWindow::showFindPanel() {
    m_ui->findPanelHost->setVisible(true);
    m_findPanel->patternLineEdit()->setFocus(Qt::ShortcutFocusReason);
    m_findPanel->patternLineEdit()->selectAll();
}

void MainWindow::refreshActions() {
    const HexEditEngine& engine = m_grid->engine();
    const bool hasStore = m_store != nullptr;
    const bool idle = !m_findActive && !engine.isFindRunning();
    const bool editable = hasStore && idle;
    m_ui->actionOpen->setEnabled(idle);
    m_ui->actionSave->setEnabled(editable);
    m_ui->actionSaveAs->setEnabled(editable);
    m_ui->actionCut->setEnabled(idle && engine.canCut());
    m_ui->actionCopy->setEnabled(engine.canCopy());
    m_ui->actionCopyHex->setEnabled(engine.canCopy());
    m_ui->actionPaste->setEnabled(idle && engine.canPaste());
    m_ui->actionPasteHex->setEnabled(idle && engine.canPasteHex());
    m_ui->actionSelectAll->setEnabled(editable);
    m_ui->actionFind->setEnabled(hasStore);
    m_ui->actionFindNext->setEnabled(editable);
    m_ui->actionFindPrevious->setEnabled(editable);
    m_ui->actionGoTo->setEnabled(editable);
    m_ui->actionEncoding->setEnabled(idle);
    m_ui->actionReadOnly->setEnabled(idle);
    m_ui->actionInsertMode->setEnabled(idle);
    m_ui->actionOverwritePaste->setEnabled(idle);
    m_ui->actionCharPane->setEnabled(idle);
    m_ui->actionLineInfo->setEnabled(idle);
    m_ui->actionColumnInfo->setEnabled(idle);
    m_ui->actionLowerCaseHex->setEnabled(idle);

    const QSignalBlocker blocker(m_ui->actionReadOnly);
    m_ui->actionReadOnly->setChecked(engine.isReadOnly());
}

void MainWindow::refreshStatusBar() {
    const HexEditEngine& engine = m_grid->engine();
    if (m_store == nullptr) {
        m_positionLabel->clear();
        m_selectionLabel->clear();
        m_insertLabel->clear();
        m_lengthLabel->clear();
        return;
    }
    m_positionLabel->setText(
        tr("Ln %1, Col %2").arg(engine.currentLine()).arg(engine.currentPositionInLine()));
    if (engine.selectionLength() > 0) {
        m_selectionLabel->setText(tr("Sel %1 + %2 bytes")
                                      .arg(formatOffset(engine.selectionStart()))
                                      .arg(engine.selectionLength()));
    } else {
        m_selectionLabel->setText(tr("Offset %1").arg(formatOffset(engine.selectionStart())));
    }
    m_insertLabel->setText(engine.isInsertActive() ? tr("INS") : tr("OVR"));
    m_lengthLabel->setText(tr("%1 bytes").arg(engine.length()));
}

void MainWindow::refreshWindowTitle() {
    if (m_filePath.isEmpty()) {
        setWindowTitle(QStringLiteral("hexgrid"));
        return;
    }
    setWindowTitle(QStringLiteral("%1%2 - hexgrid")
                       .arg(QFileInfo(m_filePath).fileName())
                       .arg(isModified() ? QStringLiteral("*") : QString()));
}

}  // namespace hexgrid
