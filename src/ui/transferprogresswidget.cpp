#include "transferprogresswidget.h"
#include "services/transferservice.h"

#include <QVBoxLayout>

TransferProgressWidget::TransferProgressWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void TransferProgressWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 4, 0, 4);

    layout->addWidget(new QLabel(tr("Per-file progress:")));

    progressBar_ = new QProgressBar();
    progressBar_->setMinimum(0);
    progressBar_->setMaximum(100);
    layout->addWidget(progressBar_);

    nameLabel_ = new QLabel();
    nameLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(nameLabel_);

    showIdle();
}

void TransferProgressWidget::setTransferService(TransferService *service)
{
    if (transferService_) {
        disconnect(transferService_, nullptr, this, nullptr);
    }

    transferService_ = service;

    if (transferService_) {
        connect(transferService_, &TransferService::jobStarted,
                this, &TransferProgressWidget::onJobStarted);
        connect(transferService_, &TransferService::jobProgress,
                this, &TransferProgressWidget::onJobProgress);
        connect(transferService_, &TransferService::jobCompleted,
                this, &TransferProgressWidget::onJobFinished);
        connect(transferService_, &TransferService::jobFailed,
                this, &TransferProgressWidget::onJobFinished);
        connect(transferService_, &TransferService::allJobsCompleted,
                this, &TransferProgressWidget::onJobFinished);
        connect(transferService_, &TransferService::queueHalted,
                this, &TransferProgressWidget::onJobFinished);
    }
}

void TransferProgressWidget::onJobStarted(const QString &displayName)
{
    progressBar_->setValue(0);
    nameLabel_->setText(QString("%1 - 0%").arg(displayName));
}

void TransferProgressWidget::onJobProgress(const QString &displayName, qint64 copied, qint64 total)
{
    int percent = 0;
    if (total > 0) {
        percent = static_cast<int>((copied * 100) / total);
    }
    progressBar_->setValue(percent);
    nameLabel_->setText(QString("%1 - %2%").arg(displayName).arg(percent));
}

void TransferProgressWidget::onJobFinished()
{
    showIdle();
}

void TransferProgressWidget::showIdle()
{
    progressBar_->setValue(0);
    nameLabel_->setText(tr("(idle)"));
}
