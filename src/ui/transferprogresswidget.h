#ifndef TRANSFERPROGRESSWIDGET_H
#define TRANSFERPROGRESSWIDGET_H

#include <QWidget>
#include <QProgressBar>
#include <QLabel>

class TransferService;

/**
 * @brief Per-file progress bar with the name of the file being copied.
 *
 * Shows "(idle)" whenever no copy is running.
 */
class TransferProgressWidget : public QWidget
{
    Q_OBJECT

public:
    explicit TransferProgressWidget(QWidget *parent = nullptr);

    void setTransferService(TransferService *service);

    [[nodiscard]] QString labelText() const { return nameLabel_->text(); }
    [[nodiscard]] int progressValue() const { return progressBar_->value(); }

private slots:
    void onJobStarted(const QString &displayName);
    void onJobProgress(const QString &displayName, qint64 copied, qint64 total);
    void onJobFinished();

private:
    void setupUi();
    void showIdle();

    // Dependencies (not owned)
    TransferService *transferService_ = nullptr;

    QProgressBar *progressBar_ = nullptr;
    QLabel *nameLabel_ = nullptr;
};

#endif // TRANSFERPROGRESSWIDGET_H
