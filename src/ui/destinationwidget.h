#ifndef DESTINATIONWIDGET_H
#define DESTINATIONWIDGET_H

#include <QWidget>
#include <QStringList>

class QComboBox;
class QLabel;
class QPushButton;

/**
 * @brief Destination picker plus Start/Stop controls.
 *
 * Lists removable drives found by DriveDetector and lets the user
 * pick one, or any folder through a directory dialog.
 */
class DestinationWidget : public QWidget
{
    Q_OBJECT

public:
    explicit DestinationWidget(QWidget *parent = nullptr);

    [[nodiscard]] QString destination() const { return destination_; }

    /**
     * @brief Replaces the drive list.
     *
     * Selects the first drive if nothing was chosen yet.
     */
    void setDrives(const QStringList &drives);

public slots:
    void setDestination(const QString &path);
    void refreshDrives();
    void setRunning(bool running);

signals:
    void destinationSelected(const QString &path);
    void drivesRefreshed(const QStringList &drives);
    void startRequested();
    void stopRequested();

private slots:
    void onDriveActivated(int index);
    void onChooseDestination();

private:
    void setupUi();

    QString destination_;

    QComboBox *driveCombo_ = nullptr;
    QLabel *selectedLabel_ = nullptr;
    QPushButton *startButton_ = nullptr;
    QPushButton *stopButton_ = nullptr;
};

#endif // DESTINATIONWIDGET_H
