#include "errorhandler.h"
#include "activitylog.h"

#include <QDir>
#include <QMessageBox>
#include <QPushButton>
#include <QDebug>

ErrorHandler::ErrorHandler(QWidget *parentWidget, QObject *parent)
    : QObject(parent)
    , parentWidget_(parentWidget)
{
}

void ErrorHandler::setActivityLog(ActivityLog *log)
{
    activityLog_ = log;
}

QString ErrorHandler::composeMessage(const QString &title, const QString &details)
{
    if (details.isEmpty() || details == title) {
        return title;
    }
    return QString("%1: %2").arg(title, details);
}

void ErrorHandler::report(ErrorCategory category, ErrorSeverity severity,
                          const QString &title, const QString &details)
{
    const QString message = composeMessage(title, details);
    const QString tagged = QString("[%1/%2] %3")
        .arg(categoryToString(category), severityToString(severity), message);

    if (severity == ErrorSeverity::Info) {
        qInfo().noquote() << tagged;
    } else if (severity == ErrorSeverity::Warning) {
        qWarning().noquote() << tagged;
    } else {
        qCritical().noquote() << tagged;
    }

    if (activityLog_) {
        activityLog_->append(message);
    }

    emit errorLogged(category, severity, title, details);
    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    report(category, severity, title, details);

    if (severity == ErrorSeverity::Critical && dialogsEnabled_) {
        QMessageBox::warning(parentWidget_, title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleParseFailure(const QString &fileName)
{
    report(ErrorCategory::Parse, ErrorSeverity::Info,
           tr("Using file name as label"), fileName);
}

void ErrorHandler::handleDestinationConflict(const QString &displayName,
                                             const QString &destinationPath)
{
    report(ErrorCategory::Destination, ErrorSeverity::Info,
           tr("Skipped %1").arg(displayName),
           tr("%1 already exists").arg(QDir::toNativeSeparators(destinationPath)));
}

void ErrorHandler::handleCopyFailed(const QString &displayName, const QString &error)
{
    report(ErrorCategory::Copy, ErrorSeverity::Warning,
           tr("Copy of %1 failed").arg(displayName), error);
}

void ErrorHandler::handleDriveError(const QString &message)
{
    report(ErrorCategory::Drive, ErrorSeverity::Warning, tr("Drive error"), message);
}

void ErrorHandler::handleQueueHalted(const QString &reason,
                                     const std::function<void()> &restartCallback)
{
    const QString title = tr("Transfer halted");

    if (!restartCallback || !dialogsEnabled_) {
        handleError(ErrorCategory::Drive, ErrorSeverity::Critical, title, reason);
        return;
    }

    // Remaining jobs are still Pending, so a restart picks them up
    report(ErrorCategory::Drive, ErrorSeverity::Critical, title, reason);
    if (askRetry(title, reason)) {
        restartCallback();
    }
}

bool ErrorHandler::askRetry(const QString &title, const QString &message)
{
    QMessageBox msgBox(parentWidget_);
    msgBox.setWindowTitle(title);
    msgBox.setText(message);
    msgBox.setInformativeText(tr("Reconnect the drive and choose Retry to continue "
                                 "with the remaining files."));
    msgBox.setIcon(QMessageBox::Warning);

    QPushButton *retryButton = msgBox.addButton(tr("Retry"), QMessageBox::AcceptRole);
    msgBox.addButton(tr("Cancel"), QMessageBox::RejectRole);
    msgBox.setDefaultButton(retryButton);
    msgBox.exec();

    return msgBox.clickedButton() == retryButton;
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Parse:
        return QStringLiteral("Parse");
    case ErrorCategory::Destination:
        return QStringLiteral("Destination");
    case ErrorCategory::Copy:
        return QStringLiteral("Copy");
    case ErrorCategory::Drive:
        return QStringLiteral("Drive");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
