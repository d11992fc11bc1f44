// Background transfer queue: one worker thread per job, cooperative
// cancellation and byte-accurate progress for single files and directory
// trees.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <memory>
#include <optional>
#include "portkeydrop/LocalFileSystem.hpp"
#include "portkeydrop/TransferClient.hpp"

// One queued/running/finished transfer.
struct TransferItem {
    enum class Direction { Upload, Download };
    // queued -> in_progress -> {completed, failed, cancelled}
    enum class Status { Queued, InProgress, Completed, Failed, Cancelled };

    quint64 id = 0;
    Direction direction = Direction::Download;
    QString remotePath;
    QString localPath;
    quint64 totalBytes = 0;
    quint64 transferredBytes = 0;
    Status status = Status::Queued;
    QString error;
    bool recursive = false;

    int progressPercent() const;
    // "42%" while in progress, otherwise the status name.
    QString displayStatus() const;
    bool isFinished() const;
};

const char *transferStatusName(TransferItem::Status st);

class TransferManager : public QObject {
    Q_OBJECT
public:
    // What to do when the destination already exists. "ask" is resolved by
    // the UI before enqueueing and behaves as Overwrite here.
    enum class OverwritePolicy { Overwrite, Skip, Rename };

    explicit TransferManager(QObject *parent = nullptr);
    TransferManager(std::shared_ptr<portkeydrop::LocalFileSystem> fs,
                    QObject *parent = nullptr);
    ~TransferManager() override;

    // All enqueue calls return immediately with the new job id. A client
    // shared by several jobs is used by one job at a time.
    quint64 enqueueDownload(std::shared_ptr<portkeydrop::TransferClient> client,
                            const QString &remotePath, const QString &localPath,
                            quint64 knownTotalBytes = 0);
    quint64 enqueueUpload(std::shared_ptr<portkeydrop::TransferClient> client,
                          const QString &localPath, const QString &remotePath);
    quint64
    enqueueRecursiveDownload(std::shared_ptr<portkeydrop::TransferClient> client,
                             const QString &remoteDir, const QString &localDir);
    quint64
    enqueueRecursiveUpload(std::shared_ptr<portkeydrop::TransferClient> client,
                           const QString &localDir, const QString &remoteDir);

    // Requests cancellation and marks the job cancelled. Returns false for an
    // unknown id; cancelling a finished job changes nothing.
    bool cancel(quint64 id);

    // Copy of every job in enqueue order.
    QVector<TransferItem> listJobs() const;
    std::optional<TransferItem> job(quint64 id) const;

    // Blocks until every worker has exited. Returns false on timeout.
    bool waitForIdle(int timeoutMs) const;

    // Maximum jobs transferring at once; 0 means unlimited.
    void setMaxConcurrent(int n);
    int maxConcurrent() const;

    void setOverwritePolicy(OverwritePolicy p);
    OverwritePolicy overwritePolicy() const;
    // Maps the settings value (ask|overwrite|skip|rename).
    static OverwritePolicy overwritePolicyFromSetting(const QString &mode);

signals:
    // Emitted (possibly from a worker thread) whenever a job changes.
    void jobsChanged();

private:
    struct State;
    struct JobSpec;
    class Worker;

    std::shared_ptr<State> d_;
    std::shared_ptr<portkeydrop::LocalFileSystem> fs_;

    quint64 enqueue(JobSpec spec, TransferItem item);
};
