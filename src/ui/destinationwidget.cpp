#include "destinationwidget.h"
#include "services/drivedetector.h"

#include <QComboBox>
#include <QDir>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>

DestinationWidget::DestinationWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void DestinationWidget::setupUi()
{
    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    layout->addWidget(new QLabel(tr("Target (drive or folder):")));

    driveCombo_ = new QComboBox();
    driveCombo_->setMinimumWidth(220);
    driveCombo_->setPlaceholderText(tr("No removable drives"));
    connect(driveCombo_, QOverload<int>::of(&QComboBox::activated),
            this, &DestinationWidget::onDriveActivated);
    layout->addWidget(driveCombo_);

    auto *refreshButton = new QPushButton(tr("Refresh Drives"));
    connect(refreshButton, &QPushButton::clicked, this, &DestinationWidget::refreshDrives);
    layout->addWidget(refreshButton);

    auto *chooseButton = new QPushButton(tr("Choose Destination..."));
    connect(chooseButton, &QPushButton::clicked, this, &DestinationWidget::onChooseDestination);
    layout->addWidget(chooseButton);

    layout->addSpacing(16);
    layout->addWidget(new QLabel(tr("Selected:")));
    selectedLabel_ = new QLabel(tr("(none)"));
    selectedLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(selectedLabel_, 1);

    stopButton_ = new QPushButton(tr("Stop"));
    connect(stopButton_, &QPushButton::clicked, this, &DestinationWidget::stopRequested);
    layout->addWidget(stopButton_);

    startButton_ = new QPushButton(tr("Start"));
    startButton_->setDefault(true);
    connect(startButton_, &QPushButton::clicked, this, &DestinationWidget::startRequested);
    layout->addWidget(startButton_);

    setRunning(false);
}

void DestinationWidget::setDrives(const QStringList &drives)
{
    driveCombo_->clear();
    for (const QString &drive : drives) {
        driveCombo_->addItem(DriveDetector::displayName(drive), drive);
    }

    int current = driveCombo_->findData(destination_);
    if (current >= 0) {
        driveCombo_->setCurrentIndex(current);
    } else if (destination_.isEmpty() && !drives.isEmpty()) {
        driveCombo_->setCurrentIndex(0);
        setDestination(drives.first());
    } else {
        driveCombo_->setCurrentIndex(-1);
    }
}

void DestinationWidget::refreshDrives()
{
    const QStringList drives = DriveDetector::removableDrives();
    setDrives(drives);
    emit drivesRefreshed(drives);
}

void DestinationWidget::setDestination(const QString &path)
{
    if (destination_ == path) {
        return;
    }
    destination_ = path;
    selectedLabel_->setText(path.isEmpty() ? tr("(none)") : QDir::toNativeSeparators(path));

    const int index = driveCombo_->findData(path);
    if (index >= 0) {
        driveCombo_->setCurrentIndex(index);
    }
    emit destinationSelected(path);
}

void DestinationWidget::setRunning(bool running)
{
    startButton_->setEnabled(!running);
    stopButton_->setEnabled(running);
}

void DestinationWidget::onDriveActivated(int index)
{
    const QString drive = driveCombo_->itemData(index).toString();
    if (!drive.isEmpty()) {
        setDestination(drive);
    }
}

void DestinationWidget::onChooseDestination()
{
    const QString path = QFileDialog::getExistingDirectory(this,
        tr("Choose Destination"), destination_);
    if (!path.isEmpty()) {
        setDestination(path);
    }
}
