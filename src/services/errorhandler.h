/**
 * @file errorhandler.h
 * @brief Turns copy, drive and naming problems into user feedback.
 *
 * Every problem ends up in the status bar, in the activity log and in the
 * Qt message log. Only an unusable destination interrupts the user with a
 * dialog.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>

class QWidget;
class ActivityLog;

/**
 * @brief Where a problem came from.
 */
enum class ErrorCategory {
    Parse,          ///< File name could not be labelled; raw name used
    Destination,    ///< Target file already exists; job skipped
    Copy,           ///< Copy of a single file failed; queue continues
    Drive,          ///< Destination missing, unplugged or read-only
    System          ///< Anything else
};

/**
 * @brief How loudly a problem is reported.
 */
enum class ErrorSeverity {
    Info,      ///< Status bar for 3 s
    Warning,   ///< Status bar for 5 s
    Critical   ///< Status bar until replaced, plus a dialog
};

/**
 * @brief Reports problems consistently across the application.
 *
 * Per-file problems never stop the queue and are reported quietly.
 * A halted queue is the only case that asks the user something.
 *
 * @par Example usage:
 * @code
 * auto *handler = new ErrorHandler(mainWindow, this);
 * handler->setActivityLog(activityLog);
 * handler->handleQueueHalted(reason, [service]() { service->start(); });
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @param parentWidget Parent for dialogs (not owned).
     * @param parent Optional parent QObject.
     */
    explicit ErrorHandler(QWidget *parentWidget, QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Mirrors every handled problem into @p log (not owned).
     */
    void setActivityLog(ActivityLog *log);

    /**
     * @brief Enables or disables modal dialogs.
     *
     * With dialogs disabled a halted queue is reported like any other
     * critical error and the restart callback is not called.
     */
    void setDialogsEnabled(bool enabled) { dialogsEnabled_ = enabled; }
    [[nodiscard]] bool dialogsEnabled() const { return dialogsEnabled_; }

    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Problems raised by the copy pipeline
    /// @{
    void handleParseFailure(const QString &fileName);
    void handleDestinationConflict(const QString &displayName, const QString &destinationPath);
    void handleCopyFailed(const QString &displayName, const QString &error);
    void handleDriveError(const QString &message);

    /**
     * @brief The queue stopped because the destination is unusable.
     * @param reason Why the queue halted.
     * @param restartCallback Called if the user chooses Retry.
     *
     * Without a callback only an information dialog is shown.
     */
    void handleQueueHalted(const QString &reason,
                           const std::function<void()> &restartCallback = {});
    /// @}

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @param timeout Milliseconds, 0 keeps the message until replaced.
     */
    void statusMessage(const QString &message, int timeout);

    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    /// Logs, mirrors to the activity log and updates the status bar.
    void report(ErrorCategory category, ErrorSeverity severity,
                const QString &title, const QString &details);
    bool askRetry(const QString &title, const QString &message);

    static QString composeMessage(const QString &title, const QString &details);

    QWidget *parentWidget_ = nullptr;
    QPointer<ActivityLog> activityLog_;
    bool dialogsEnabled_ = true;
};

#endif // ERRORHANDLER_H
