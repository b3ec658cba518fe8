#pragma once

#include <QWidget>

#include <memory>

#include "find/FindEngine.h"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QToolButton;
namespace Ui {
class FindPanel;
}
QT_END_NAMESPACE

namespace hexgrid {

class FindPanel : public QWidget {
    Q_OBJECT

public:
    explicit FindPanel(QWidget* parent = nullptr);
    ~FindPanel() override;

    QLineEdit* patternLineEdit() const;
    QComboBox* kindCombo() const;
    QCheckBox* matchCaseCheckBox() const;
    QPushButton* findNextButton() const;
    QPushButton* findPreviousButton() const;
    QPushButton* cancelButton() const;
    QToolButton* closeButton() const;
    QLabel* statusLabel() const;

    // Pattern, kind and case from the form. Hex text that does not parse
    // yields empty hexBytes, which FindEngine rejects.
    FindOptions findOptions(FindDirection direction) const;
    void setFindRunning(bool running);
    void setStatusText(const QString& text);

signals:
    void findRequested(hexgrid::FindDirection direction);
    void cancelRequested();
    void closeRequested();

private:
    std::unique_ptr<Ui::FindPanel> m_ui;
};

}  // namespace hexgrid
