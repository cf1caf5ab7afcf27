#include "transferqueuewidget.h"
#include "models/transferqueue.h"
#include "services/transferservice.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QStyledItemDelegate>
#include <QPainter>
#include <QApplication>
#include <QStyleOptionProgressBar>
#include <algorithm>

class TransferJobDelegate : public QStyledItemDelegate
{
public:
    using QStyledItemDelegate::QStyledItemDelegate;

    void paint(QPainter *painter, const QStyleOptionViewItem &option,
               const QModelIndex &index) const override
    {
        QStyleOptionViewItem opt = option;
        initStyleOption(&opt, index);

        painter->save();

        // Background
        if (opt.state & QStyle::State_Selected) {
            painter->fillRect(opt.rect, opt.palette.highlight());
        }

        QRect rect = opt.rect.adjusted(4, 4, -4, -4);

        QString displayName = index.data(TransferQueue::DisplayNameRole).toString();
        QString fileName = index.data(TransferQueue::FileNameRole).toString();

        const auto status = static_cast<TransferJob::Status>(
            index.data(TransferQueue::StatusRole).toInt());
        QString statusText;
        QColor statusColor;
        switch (status) {
        case TransferJob::Status::Pending:
            statusText = QObject::tr("Pending");
            statusColor = Qt::gray;
            break;
        case TransferJob::Status::InProgress:
            statusText = QObject::tr("Copying");
            statusColor = Qt::blue;
            break;
        case TransferJob::Status::Done:
            statusText = QObject::tr("Done");
            statusColor = Qt::darkGreen;
            break;
        case TransferJob::Status::Failed:
            statusText = QObject::tr("Failed");
            statusColor = Qt::red;
            break;
        case TransferJob::Status::Skipped:
            statusText = QObject::tr("Skipped");
            statusColor = QColor(0xb0, 0x70, 0x00);
            break;
        }

        painter->setFont(opt.font);

        QRect textRect = rect;
        textRect.setHeight(rect.height() / 2);

        painter->setPen(statusColor);
        painter->drawText(textRect, Qt::AlignLeft | Qt::AlignVCenter,
                          QString("%1 - %2").arg(displayName, statusText));

        QRect detailRect = rect;
        detailRect.setTop(rect.top() + rect.height() / 2 + 2);
        detailRect.setHeight(rect.height() / 2 - 4);

        if (status == TransferJob::Status::InProgress) {
            int progress = index.data(TransferQueue::ProgressRole).toInt();

            QStyleOptionProgressBar progressBarOption;
            progressBarOption.rect = detailRect;
            progressBarOption.minimum = 0;
            progressBarOption.maximum = 100;
            progressBarOption.progress = progress;
            progressBarOption.text = QString("%1%").arg(progress);
            progressBarOption.textVisible = true;

            QApplication::style()->drawControl(QStyle::CE_ProgressBar,
                                                &progressBarOption, painter);
        } else {
            // Second line: source file name, or the error for failed jobs
            QString detail = fileName;
            if (status == TransferJob::Status::Failed || status == TransferJob::Status::Skipped) {
                const QString error = index.data(TransferQueue::ErrorMessageRole).toString();
                if (!error.isEmpty()) {
                    detail = QString("%1 (%2)").arg(fileName, error);
                }
            }
            painter->setPen(opt.palette.color(QPalette::PlaceholderText));
            painter->drawText(detailRect, Qt::AlignLeft | Qt::AlignVCenter,
                              painter->fontMetrics().elidedText(detail, Qt::ElideMiddle,
                                                                detailRect.width()));
        }

        painter->restore();
    }

    QSize sizeHint(const QStyleOptionViewItem &option,
                   const QModelIndex &index) const override
    {
        Q_UNUSED(index)
        return QSize(option.rect.width(), 44);
    }
};

TransferQueueWidget::TransferQueueWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void TransferQueueWidget::setTransferService(TransferService *service)
{
    if (service_) {
        disconnect(service_, nullptr, this, nullptr);
        disconnect(service_->queue(), nullptr, this, nullptr);
    }

    service_ = service;

    if (service_) {
        TransferQueue *queue = service_->queue();
        listView_->setModel(queue);
        connect(service_, &TransferService::queueChanged,
                this, &TransferQueueWidget::onQueueChanged);
        connect(queue, &TransferQueue::dataChanged,
                this, [this]() { listView_->viewport()->update(); });
        connect(listView_->selectionModel(), &QItemSelectionModel::selectionChanged,
                this, &TransferQueueWidget::updateButtons);
    }

    onQueueChanged();
}

void TransferQueueWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    statusLabel_ = new QLabel(tr("Queue"));
    statusLabel_->setObjectName("heading");
    layout->addWidget(statusLabel_);

    listView_ = new QListView();
    listView_->setItemDelegate(new TransferJobDelegate(listView_));
    listView_->setSelectionMode(QAbstractItemView::ExtendedSelection);
    listView_->setAlternatingRowColors(true);
    layout->addWidget(listView_, 1);

    auto *buttonLayout = new QHBoxLayout();

    removeButton_ = new QPushButton(tr("Remove Selected"));
    connect(removeButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onRemoveSelected);
    buttonLayout->addWidget(removeButton_);

    retryButton_ = new QPushButton(tr("Retry"));
    retryButton_->setToolTip(tr("Queue the selected failed or skipped files again"));
    connect(retryButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onRetrySelected);
    buttonLayout->addWidget(retryButton_);

    clearDoneButton_ = new QPushButton(tr("Clear Done"));
    connect(clearDoneButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onClearFinished);
    buttonLayout->addWidget(clearDoneButton_);

    clearButton_ = new QPushButton(tr("Clear Queue"));
    connect(clearButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onClearQueue);
    buttonLayout->addWidget(clearButton_);

    buttonLayout->addStretch();
    layout->addLayout(buttonLayout);

    updateButtons();
}

QList<int> TransferQueueWidget::selectedRows() const
{
    QList<int> rows;
    if (!listView_->selectionModel()) {
        return rows;
    }
    const QModelIndexList indexes = listView_->selectionModel()->selectedIndexes();
    for (const QModelIndex &index : indexes) {
        rows.append(index.row());
    }
    std::sort(rows.begin(), rows.end());
    return rows;
}

void TransferQueueWidget::onQueueChanged()
{
    updateButtons();

    if (service_) {
        const TransferQueue *queue = service_->queue();
        int pending = queue->pendingCount();
        int active = queue->activeCount();
        int total = queue->rowCount();

        if (total == 0) {
            statusLabel_->setText(tr("Queue"));
        } else if (active > 0) {
            statusLabel_->setText(tr("Queue - copying (%1 pending)").arg(pending));
        } else {
            statusLabel_->setText(tr("Queue (%1 items, %2 pending)").arg(total).arg(pending));
        }
    }
}

void TransferQueueWidget::onRemoveSelected()
{
    if (!service_) {
        return;
    }
    // Highest row first so earlier removals do not shift later ones
    const QList<int> rows = selectedRows();
    for (auto it = rows.crbegin(); it != rows.crend(); ++it) {
        service_->removeJob(*it);
    }
}

void TransferQueueWidget::onRetrySelected()
{
    if (!service_) {
        return;
    }
    // Resolve ids first; each retry moves a row to the tail
    const TransferQueue *queue = service_->queue();
    QList<int> ids;
    for (int row : selectedRows()) {
        ids.append(queue->job(row).id);
    }
    for (int id : ids) {
        service_->retry(queue->indexOfJob(id));
    }
}

void TransferQueueWidget::onClearFinished()
{
    if (service_) {
        service_->removeFinished();
    }
}

void TransferQueueWidget::onClearQueue()
{
    if (service_) {
        service_->clear();
    }
}

void TransferQueueWidget::updateButtons()
{
    if (!service_) {
        removeButton_->setEnabled(false);
        retryButton_->setEnabled(false);
        clearDoneButton_->setEnabled(false);
        clearButton_->setEnabled(false);
        return;
    }

    const TransferQueue *queue = service_->queue();
    bool hasItems = queue->rowCount() > 0;
    bool hasSelection = !selectedRows().isEmpty();

    removeButton_->setEnabled(hasSelection);
    retryButton_->setEnabled(hasSelection);
    clearDoneButton_->setEnabled(queue->finishedCount() > 0);
    clearButton_->setEnabled(hasItems);
}
