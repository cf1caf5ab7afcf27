#ifndef ACTIVITYLOGWIDGET_H
#define ACTIVITYLOGWIDGET_H

#include <QWidget>

class QPlainTextEdit;
class ActivityLog;

/**
 * @brief Read-only view of the ActivityLog.
 */
class ActivityLogWidget : public QWidget
{
    Q_OBJECT

public:
    explicit ActivityLogWidget(QWidget *parent = nullptr);

    void setActivityLog(ActivityLog *log);

    [[nodiscard]] QString text() const;

private slots:
    void onEntryAdded(const QString &line);

private:
    void setupUi();

    ActivityLog *log_ = nullptr;
    QPlainTextEdit *textEdit_ = nullptr;
};

#endif // ACTIVITYLOGWIDGET_H
