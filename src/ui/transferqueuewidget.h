#ifndef TRANSFERQUEUEWIDGET_H
#define TRANSFERQUEUEWIDGET_H

#include <QWidget>
#include <QListView>
#include <QPushButton>
#include <QLabel>

class TransferService;

class TransferQueueWidget : public QWidget
{
    Q_OBJECT

public:
    explicit TransferQueueWidget(QWidget *parent = nullptr);

    void setTransferService(TransferService *service);

    [[nodiscard]] QList<int> selectedRows() const;

private slots:
    void onQueueChanged();
    void onRemoveSelected();
    void onRetrySelected();
    void onClearFinished();
    void onClearQueue();

private:
    void setupUi();
    void updateButtons();

    TransferService *service_ = nullptr;
    QListView *listView_ = nullptr;
    QLabel *statusLabel_ = nullptr;
    QPushButton *removeButton_ = nullptr;
    QPushButton *retryButton_ = nullptr;
    QPushButton *clearDoneButton_ = nullptr;
    QPushButton *clearButton_ = nullptr;
};

#endif // TRANSFERQUEUEWIDGET_H
