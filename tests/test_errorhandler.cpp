/**
 * @file test_errorhandler.cpp
 * @brief Unit tests for ErrorHandler.
 *
 * Dialogs are disabled so critical paths run without user input.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QWidget>

#include "services/activitylog.h"
#include "services/errorhandler.h"

class TestErrorHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Severity to status bar
    void testStatusMessageCombinesTitleAndDetails();
    void testDetailsEqualToTitleAreNotRepeated();
    void testTimeouts_data();
    void testTimeouts();

    // Pipeline problems
    void testCopyFailedIsWarning();
    void testDriveError();
    void testParseFailureIsInfo();
    void testDestinationConflict();
    void testQueueHaltedWithoutDialogsDoesNotRestart();

    // Activity log
    void testProblemsAreMirroredToActivityLog();
    void testDeletedActivityLogIsIgnored();

    void testCategoryAndSeverityNames();

private:
    QWidget *parentWidget_ = nullptr;
    ErrorHandler *handler_ = nullptr;
};

void TestErrorHandler::init()
{
    parentWidget_ = new QWidget();
    handler_ = new ErrorHandler(parentWidget_, this);
    handler_->setDialogsEnabled(false);
}

void TestErrorHandler::cleanup()
{
    delete handler_;
    handler_ = nullptr;
    delete parentWidget_;
    parentWidget_ = nullptr;
}

void TestErrorHandler::testStatusMessageCombinesTitleAndDetails()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Info,
                          "Settings not saved", "Disk full");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Settings not saved: Disk full"));
}

void TestErrorHandler::testDetailsEqualToTitleAreNotRepeated()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Info, "Oops", "Oops");

    QCOMPARE(spy.at(0).at(0).toString(), QString("Oops"));
}

void TestErrorHandler::testTimeouts_data()
{
    QTest::addColumn<int>("severity");
    QTest::addColumn<int>("timeout");

    QTest::newRow("info") << int(ErrorSeverity::Info) << 3000;
    QTest::newRow("warning") << int(ErrorSeverity::Warning) << 5000;
    QTest::newRow("critical") << int(ErrorSeverity::Critical) << 0;
}

void TestErrorHandler::testTimeouts()
{
    QFETCH(int, severity);
    QFETCH(int, timeout);

    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    handler_->handleError(ErrorCategory::System, static_cast<ErrorSeverity>(severity), "Message");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), timeout);
}

void TestErrorHandler::testCopyFailedIsWarning()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleCopyFailed("The Matrix (1999)", "Permission denied");

    QCOMPARE(spy.count(), 1);
    QString message = spy.at(0).at(0).toString();
    QVERIFY(message.contains("The Matrix (1999)"));
    QVERIFY(message.contains("Permission denied"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
    QCOMPARE(loggedSpy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Copy);
    QCOMPARE(loggedSpy.at(0).at(1).value<ErrorSeverity>(), ErrorSeverity::Warning);
}

void TestErrorHandler::testDriveError()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleDriveError("Destination E: is not writable");

    QVERIFY(spy.at(0).at(0).toString().contains("not writable"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
    QCOMPARE(loggedSpy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Drive);
}

void TestErrorHandler::testParseFailureIsInfo()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleParseFailure("[Group].mkv");

    QVERIFY(spy.at(0).at(0).toString().contains("[Group].mkv"));
    QCOMPARE(spy.at(0).at(1).toInt(), 3000);
    QCOMPARE(loggedSpy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Parse);
}

void TestErrorHandler::testDestinationConflict()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleDestinationConflict("Dune (2021)", "/media/usb/Dune (2021)/dune.mkv");

    QString message = spy.at(0).at(0).toString();
    QVERIFY(message.startsWith("Skipped Dune (2021)"));
    QVERIFY(message.contains("already exists"));
    QCOMPARE(spy.at(0).at(1).toInt(), 3000);
}

void TestErrorHandler::testQueueHaltedWithoutDialogsDoesNotRestart()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);
    int restarts = 0;

    handler_->handleQueueHalted("Destination disconnected", [&restarts]() { ++restarts; });

    QCOMPARE(restarts, 0);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Transfer halted: Destination disconnected"));
    QCOMPARE(spy.at(0).at(1).toInt(), 0);
    QCOMPARE(loggedSpy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Drive);
    QCOMPARE(loggedSpy.at(0).at(1).value<ErrorSeverity>(), ErrorSeverity::Critical);
}

void TestErrorHandler::testProblemsAreMirroredToActivityLog()
{
    ActivityLog log;
    handler_->setActivityLog(&log);

    handler_->handleCopyFailed("Alien (1979)", "Cannot open source");
    handler_->handleQueueHalted("No destination selected");

    QCOMPARE(log.count(), 2);
    QVERIFY(log.entries().at(0).endsWith("Copy of Alien (1979) failed: Cannot open source"));
    QVERIFY(log.entries().at(1).endsWith("Transfer halted: No destination selected"));
}

void TestErrorHandler::testDeletedActivityLogIsIgnored()
{
    auto *log = new ActivityLog();
    handler_->setActivityLog(log);
    delete log;

    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    handler_->handleDriveError("gone");

    QCOMPARE(spy.count(), 1);
}

void TestErrorHandler::testCategoryAndSeverityNames()
{
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Parse), QString("Parse"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Destination), QString("Destination"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Copy), QString("Copy"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Drive), QString("Drive"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::System), QString("System"));

    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Info), QString("INFO"));
    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Warning), QString("WARN"));
    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Critical), QString("CRIT"));
}

QTEST_MAIN(TestErrorHandler)
#include "test_errorhandler.moc"
