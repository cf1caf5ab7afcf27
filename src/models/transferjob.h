/**
 * @file transferjob.h
 * @brief A single file's pending or completed copy operation.
 */

#ifndef TRANSFERJOB_H
#define TRANSFERJOB_H

#include <QString>

struct TransferJob {
    enum class Status { Pending, InProgress, Done, Failed, Skipped };

    int id = -1;                 // Assigned by TransferQueue::enqueue()
    QString sourcePath;
    QString targetFolder;        // Relative to the destination root, may be empty
    QString targetFileName;
    QString displayName;
    Status status = Status::Pending;
    qint64 bytesCopied = 0;
    qint64 totalBytes = 0;
    QString errorMessage;
    QString destinationPath;     // Set once resolved against a destination root

    [[nodiscard]] bool isFinished() const
    {
        return status == Status::Done || status == Status::Failed || status == Status::Skipped;
    }

    [[nodiscard]] int progressPercent() const
    {
        if (status == Status::Done) {
            return 100;
        }
        if (totalBytes <= 0) {
            return 0;
        }
        return static_cast<int>((bytesCopied * 100) / totalBytes);
    }
};

/// @brief Convert a job status to string for logging
[[nodiscard]] inline const char* jobStatusToString(TransferJob::Status status) {
    switch (status) {
        case TransferJob::Status::Pending: return "Pending";
        case TransferJob::Status::InProgress: return "InProgress";
        case TransferJob::Status::Done: return "Done";
        case TransferJob::Status::Failed: return "Failed";
        case TransferJob::Status::Skipped: return "Skipped";
    }
    return "Unknown";
}

#endif // TRANSFERJOB_H
