#include "activitylogwidget.h"
#include "services/activitylog.h"

#include <QPlainTextEdit>
#include <QScrollBar>
#include <QVBoxLayout>

ActivityLogWidget::ActivityLogWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void ActivityLogWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 0, 4, 4);

    textEdit_ = new QPlainTextEdit();
    textEdit_->setReadOnly(true);
    textEdit_->setMaximumBlockCount(ActivityLog::DefaultMaxEntries);
    textEdit_->setLineWrapMode(QPlainTextEdit::NoWrap);
    layout->addWidget(textEdit_);
}

void ActivityLogWidget::setActivityLog(ActivityLog *log)
{
    if (log_) {
        disconnect(log_, nullptr, this, nullptr);
    }

    log_ = log;
    textEdit_->clear();

    if (log_) {
        textEdit_->setMaximumBlockCount(log_->maxEntries());
        for (const QString &line : log_->entries()) {
            textEdit_->appendPlainText(line);
        }
        connect(log_, &ActivityLog::entryAdded, this, &ActivityLogWidget::onEntryAdded);
        connect(log_, &ActivityLog::cleared, textEdit_, &QPlainTextEdit::clear);
    }
}

QString ActivityLogWidget::text() const
{
    return textEdit_->toPlainText();
}

void ActivityLogWidget::onEntryAdded(const QString &line)
{
    textEdit_->appendPlainText(line);
    textEdit_->verticalScrollBar()->setValue(textEdit_->verticalScrollBar()->maximum());
}
