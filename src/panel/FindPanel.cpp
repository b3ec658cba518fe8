#include "panel/FindPanel.h"

#include <QCheckBox>
#include <QComboBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QToolButton>

#include "edit/ClipboardCodec.h"
#include "ui_FindPanel.h"

namespace hexgrid {

namespace {
constexpr int kTextKindIndex = 0;
constexpr int kHexKindIndex = 1;
}  // namespace

FindPanel::FindPanel(QWidget* parent) : QWidget(parent), m_ui(std::make_unique<Ui::FindPanel>()) {
    m_ui->setupUi(this);
    m_ui->kindCombo->setCurrentIndex(kTextKindIndex);

    connect(m_ui->findNextButton, &QPushButton::clicked, this,
            [this]() { emit findRequested(FindDirection::Forward); });
    connect(m_ui->findPreviousButton, &QPushButton::clicked, this,
            [this]() { emit findRequested(FindDirection::Backward); });
    connect(m_ui->patternLineEdit, &QLineEdit::returnPressed, this,
            [this]() { emit findRequested(FindDirection::Forward); });
    connect(m_ui->cancelButton, &QPushButton::clicked, this, &FindPanel::cancelRequested);
    connect(m_ui->closeButton, &QToolButton::clicked, this, &FindPanel::closeRequested);
    connect(m_ui->kindCombo, qOverload<int>(&QComboBox::currentIndexChanged), this,
            [this](int index) { m_ui->matchCaseCheckBox->setEnabled(index == kTextKindIndex); });
}

FindPanel::~FindPanel() = default;

QLineEdit* FindPanel::patternLineEdit() const { return m_ui->patternLineEdit; }

QComboBox* FindPanel::kindCombo() const { return m_ui->kindCombo; }

QCheckBox* FindPanel::matchCaseCheckBox() const { return m_ui->matchCaseCheckBox; }

QPushButton* FindPanel::findNextButton() const { return m_ui->findNextButton; }

QPushButton* FindPanel::findPreviousButton() const { return m_ui->findPreviousButton; }

QPushButton* FindPanel::cancelButton() const { return m_ui->cancelButton; }

QToolButton* FindPanel::closeButton() const { return m_ui->closeButton; }

QLabel* FindPanel::statusLabel() const { return m_ui->statusLabel; }

FindOptions FindPanel::findOptions(FindDirection direction) const {
    FindOptions options;
    options.direction = direction;
    options.matchCase = m_ui->matchCaseCheckBox->isChecked();
    if (m_ui->kindCombo->currentIndex() == kHexKindIndex) {
        options.kind = FindPatternKind::Hex;
        options.hexBytes =
            ClipboardCodec::parseHexText(m_ui->patternLineEdit->text()).value_or(QByteArray());
    } else {
        options.kind = FindPatternKind::Text;
        options.text = m_ui->patternLineEdit->text();
    }
    return options;
}

void FindPanel::setFindRunning(bool running) {
    m_ui->findNextButton->setEnabled(!running);
    m_ui->findPreviousButton->setEnabled(!running);
    m_ui->patternLineEdit->setReadOnly(running);
    m_ui->cancelButton->setEnabled(running);
}

void FindPanel::setStatusText(const QString& text) { m_ui->statusLabel->setText(text); }

}  // namespace hexgrid
