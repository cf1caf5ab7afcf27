#ifndef PREFERENCESDIALOG_H
#define PREFERENCESDIALOG_H

#include <QDialog>
#include <QLineEdit>
#include <QComboBox>
#include <QSpinBox>
#include <QLabel>

class PreferencesDialog : public QDialog
{
    Q_OBJECT

public:
    explicit PreferencesDialog(QWidget *parent = nullptr);
    ~PreferencesDialog() override;

private slots:
    void onAccept();
    void updateLayoutExample();

private:
    void setupUi();
    void loadSettings();
    void saveSettings();

    // Destination settings
    QComboBox *layoutCombo_ = nullptr;
    QLabel *layoutExampleLabel_ = nullptr;

    // Media settings
    QLineEdit *extensionsEdit_ = nullptr;

    // Monitor settings
    QSpinBox *pollIntervalSpin_ = nullptr;
};

#endif // PREFERENCESDIALOG_H
