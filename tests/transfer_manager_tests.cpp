// TransferManager tests against the in-memory mock server and a temporary
// local directory (run via CTest).
#include "TransferManager.hpp"
#include "portkeydrop/MockTransferClient.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

using portkeydrop::MockTransferClient;
using portkeydrop::OpError;
using portkeydrop::RemoteFile;
using Status = TransferItem::Status;

std::shared_ptr<MockTransferClient> connectedMock() {
    auto c = std::make_shared<MockTransferClient>();
    OpError err;
    if (!c->connect(err))
        std::cerr << "[WARN] mock connect failed: " << err.message << "\n";
    return c;
}

bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 5000) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

QByteArray readAll(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

bool writeFile(const QString &path, const QByteArray &data) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(data) == data.size();
}

Status statusOf(const TransferManager &mgr, quint64 id) {
    auto j = mgr.job(id);
    return j ? j->status : Status::Failed;
}

// Mock server whose listing of one directory carries an extra entry with
// an arbitrary name, the way a broken or hostile server might answer.
class InjectedEntryClient : public MockTransferClient {
public:
    InjectedEntryClient(std::string dir, std::string name, bool isDir)
        : dir_(std::move(dir)), name_(std::move(name)), isDir_(isDir) {}

    bool listDir(const std::string &path, std::vector<RemoteFile> &out,
                 OpError &err) override {
        if (!MockTransferClient::listDir(path, out, err))
            return false;
        if (path == dir_) {
            RemoteFile f;
            f.name = name_;
            f.path = dir_ + "/" + name_;
            f.isDir = isDir_;
            f.size = isDir_ ? 0 : 4;
            out.push_back(f);
        }
        return true;
    }

private:
    std::string dir_;
    std::string name_;
    bool isDir_;
};

void test_item_helpers(TestContext &t) {
    TransferItem item;
    t.check(item.progressPercent() == 0, "no total gives 0%");
    t.check(item.displayStatus() == "queued", "queued display");
    item.status = Status::InProgress;
    item.totalBytes = 200;
    item.transferredBytes = 50;
    t.check(item.progressPercent() == 25, "25% progress");
    t.check(item.displayStatus() == "25%", "in-progress display shows percent");
    item.status = Status::Cancelled;
    t.check(item.displayStatus() == "cancelled", "cancelled display");
    t.check(item.isFinished(), "cancelled is terminal");
    t.check(TransferManager::overwritePolicyFromSetting("skip") ==
                TransferManager::OverwritePolicy::Skip,
            "skip setting");
    t.check(TransferManager::overwritePolicyFromSetting("ask") ==
                TransferManager::OverwritePolicy::Overwrite,
            "ask behaves as overwrite");
}

void test_single_download(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/data/report.txt", std::string(20000, 'r'));
    client->setChunkSize(4096);

    TransferManager mgr;
    int notifications = 0;
    std::mutex m;
    QObject::connect(
        &mgr, &TransferManager::jobsChanged, &mgr,
        [&] {
            std::lock_guard<std::mutex> lk(m);
            ++notifications;
        },
        Qt::DirectConnection);

    const QString local = tmp.filePath("report.txt");
    const quint64 id = mgr.enqueueDownload(client, "/data/report.txt", local);
    t.check(id == 1, "first job id is 1");
    const quint64 id2 = mgr.enqueueDownload(client, "/data/report.txt",
                                            tmp.filePath("copy.txt"), 20000);
    t.check(id2 == 2, "ids are monotonic");
    t.check(mgr.waitForIdle(5000), "download finishes");

    auto j = mgr.job(id);
    t.check(j && j->status == Status::Completed, "download completed");
    t.check(j && j->totalBytes == 20000 && j->transferredBytes == 20000,
            "byte counters match file size");
    t.check(j && j->direction == TransferItem::Direction::Download,
            "direction recorded");
    t.check(readAll(local).size() == 20000, "local file written");
    t.check(!QFile::exists(local + ".part"), "no partial file left");
    t.check(statusOf(mgr, id2) == Status::Completed, "second job completed");
    std::lock_guard<std::mutex> lk(m);
    t.check(notifications >= 4, "observer notified on state changes");
    t.check(mgr.listJobs().size() == 2, "jobs are retained");
}

void test_single_upload(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addDir("/in");
    const QString local = tmp.filePath("up.bin");
    t.check(writeFile(local, QByteArray(3000, 'u')), "fixture written");

    TransferManager mgr;
    const quint64 id = mgr.enqueueUpload(client, local, "/in/up.bin");
    t.check(mgr.waitForIdle(5000), "upload finishes");
    auto j = mgr.job(id);
    t.check(j && j->status == Status::Completed, "upload completed");
    t.check(j && j->totalBytes == 3000 && j->transferredBytes == 3000,
            "upload byte counters");
    t.check(client->fileContent("/in/up.bin") == std::string(3000, 'u'),
            "remote content matches");

    const quint64 missing =
        mgr.enqueueUpload(client, tmp.filePath("nope.bin"), "/in/nope.bin");
    t.check(mgr.waitForIdle(5000), "missing-source upload finishes");
    auto m = mgr.job(missing);
    t.check(m && m->status == Status::Failed && !m->error.isEmpty(),
            "missing local source fails with an error");
}

void test_recursive_download_progress(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/tree/a.txt", std::string(10, 'a'));
    client->addFile("/tree/sub/b.txt", std::string(20, 'b'));
    client->addFile("/tree/sub/deeper/c.txt", std::string(30, 'c'));
    client->addDir("/tree/empty");
    client->setChunkSize(5);

    TransferManager mgr;
    std::mutex m;
    std::vector<std::pair<quint64, quint64>> samples; // (total, transferred)
    QObject::connect(
        &mgr, &TransferManager::jobsChanged, &mgr,
        [&] {
            const auto jobs = mgr.listJobs();
            if (jobs.isEmpty() || jobs[0].status != Status::InProgress)
                return;
            std::lock_guard<std::mutex> lk(m);
            samples.emplace_back(jobs[0].totalBytes, jobs[0].transferredBytes);
        },
        Qt::DirectConnection);

    const QString dest = tmp.filePath("out");
    const quint64 id = mgr.enqueueRecursiveDownload(client, "/tree", dest);
    t.check(mgr.waitForIdle(5000), "recursive download finishes");

    auto j = mgr.job(id);
    t.check(j && j->status == Status::Completed, "recursive download completed");
    t.check(j && j->recursive, "job flagged recursive");
    t.check(j && j->totalBytes == 60 && j->transferredBytes == 60,
            "total is the sum of file sizes");
    t.check(readAll(dest + "/a.txt") == QByteArray(10, 'a'), "a.txt copied");
    t.check(readAll(dest + "/sub/b.txt") == QByteArray(20, 'b'), "b.txt copied");
    t.check(readAll(dest + "/sub/deeper/c.txt") == QByteArray(30, 'c'),
            "c.txt copied");
    t.check(QFileInfo(dest + "/empty").isDir(), "empty directory recreated");

    std::lock_guard<std::mutex> lk(m);
    bool totalKnown = true;
    bool increasing = true;
    quint64 last = 0;
    bool sawByte = false;
    for (const auto &s : samples) {
        if (s.second > 0) {
            sawByte = true;
            if (s.first != 60)
                totalKnown = false;
        }
        if (s.second < last)
            increasing = false;
        last = s.second;
    }
    t.check(sawByte, "progress was reported");
    t.check(totalKnown, "total was 60 before any byte moved");
    t.check(increasing, "cumulative progress never resets between files");
}

void test_recursive_upload(TestContext &t) {
    QTemporaryDir tmp;
    const QString src = tmp.filePath("src");
    t.check(writeFile(src + "/one.txt", "1"), "fixture one");
    t.check(writeFile(src + "/x/two.txt", "22"), "fixture two");
    t.check(writeFile(src + "/x/y/three.txt", "333"), "fixture three");
    QDir().mkpath(src + "/hollow");

    auto client = connectedMock();
    client->addDir("/remote");
    TransferManager mgr;
    const quint64 id = mgr.enqueueRecursiveUpload(client, src, "/remote/dst");
    t.check(mgr.waitForIdle(5000), "recursive upload finishes");

    auto j = mgr.job(id);
    t.check(j && j->status == Status::Completed, "recursive upload completed");
    t.check(j && j->totalBytes == 6 && j->transferredBytes == 6,
            "recursive upload totals");
    t.check(client->fileContent("/remote/dst/one.txt") == std::string("1"),
            "root file uploaded");
    t.check(client->fileContent("/remote/dst/x/y/three.txt") ==
                std::string("333"),
            "nested file uploaded");
    t.check(client->hasDir("/remote/dst/hollow"), "empty directory created");

    const auto made = client->createdDirs();
    auto pos = [&](const std::string &p) {
        return std::find(made.begin(), made.end(), p) - made.begin();
    };
    t.check(pos("/remote/dst") < pos("/remote/dst/x") &&
                pos("/remote/dst/x") < pos("/remote/dst/x/y"),
            "parents created before children");

    // Second run: every mkdir fails with "exists" and is ignored.
    const quint64 again = mgr.enqueueRecursiveUpload(client, src, "/remote/dst");
    t.check(mgr.waitForIdle(5000), "repeat upload finishes");
    t.check(statusOf(mgr, again) == Status::Completed,
            "existing directories do not fail the job");
}

void test_cancel_download(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/big.bin", std::string(4000, 'x'));
    client->setChunkSize(10);
    client->setChunkDelay(std::chrono::milliseconds(5));

    TransferManager mgr;
    const QString local = tmp.filePath("big.bin");
    const quint64 id = mgr.enqueueDownload(client, "/big.bin", local);
    t.check(waitUntil([&] {
                auto j = mgr.job(id);
                return j && j->transferredBytes > 0;
            }),
            "download started moving bytes");
    t.check(mgr.cancel(id), "cancel known job");
    t.check(statusOf(mgr, id) == Status::Cancelled,
            "job is cancelled immediately");
    t.check(mgr.waitForIdle(5000), "cancelled worker exits");
    t.check(statusOf(mgr, id) == Status::Cancelled,
            "job stays cancelled after the worker exits");
    t.check(!QFile::exists(local), "no file at the destination");
    t.check(!QFile::exists(local + ".part"), "partial file removed");

    t.check(!mgr.cancel(9999), "unknown id reports false");

    client->setChunkDelay(std::chrono::milliseconds(0));
    const quint64 done = mgr.enqueueDownload(client, "/big.bin",
                                             tmp.filePath("done.bin"));
    t.check(mgr.waitForIdle(5000), "second download finishes");
    t.check(mgr.cancel(done), "cancel of finished job is accepted");
    t.check(statusOf(mgr, done) == Status::Completed,
            "finished job is not changed by cancel");
}

void test_cancel_recursive_upload(TestContext &t) {
    QTemporaryDir tmp;
    const QString src = tmp.filePath("src");
    for (int i = 0; i < 5; ++i)
        writeFile(QString("%1/f%2.bin").arg(src).arg(i), QByteArray(500, 'z'));

    auto client = connectedMock();
    client->setChunkSize(10);
    client->setChunkDelay(std::chrono::milliseconds(5));
    TransferManager mgr;
    const quint64 id = mgr.enqueueRecursiveUpload(client, src, "/up");
    t.check(waitUntil([&] {
                auto j = mgr.job(id);
                return j && j->transferredBytes > 0;
            }),
            "recursive upload started");
    mgr.cancel(id);
    t.check(mgr.waitForIdle(5000), "cancelled recursive upload exits");
    t.check(statusOf(mgr, id) == Status::Cancelled, "whole job cancelled");
    t.check(!client->fileContent("/up/f4.bin").has_value(),
            "later files are not transferred");
}

void test_failure_isolation(TestContext &t) {
    QTemporaryDir tmp;
    auto broken = connectedMock();
    broken->addFile("/bad.txt", "bad");
    broken->failPath("/bad.txt", "permission denied");
    auto healthy = connectedMock();
    healthy->addFile("/good.txt", "good");

    TransferManager mgr;
    const quint64 bad =
        mgr.enqueueDownload(broken, "/bad.txt", tmp.filePath("bad.txt"));
    const quint64 good =
        mgr.enqueueDownload(healthy, "/good.txt", tmp.filePath("good.txt"));
    t.check(mgr.waitForIdle(5000), "both jobs finish");

    auto b = mgr.job(bad);
    t.check(b && b->status == Status::Failed, "failing job is failed");
    t.check(b && b->error.contains("permission denied"),
            "error text captured");
    t.check(statusOf(mgr, good) == Status::Completed,
            "other job unaffected");
    t.check(!QFile::exists(tmp.filePath("bad.txt.part")),
            "failed download leaves no partial file");

    auto offline = std::make_shared<MockTransferClient>();
    const quint64 nc =
        mgr.enqueueDownload(offline, "/x", tmp.filePath("x.txt"));
    t.check(mgr.waitForIdle(5000), "not-connected job finishes");
    t.check(statusOf(mgr, nc) == Status::Failed, "not connected fails the job");

    const quint64 missing = mgr.enqueueRecursiveDownload(
        healthy, "/no/such/dir", tmp.filePath("none"));
    t.check(mgr.waitForIdle(5000), "missing tree job finishes");
    t.check(statusOf(mgr, missing) == Status::Failed,
            "listing failure fails the recursive job");
}

void test_concurrency_gate(TestContext &t) {
    QTemporaryDir tmp;
    TransferManager mgr;
    mgr.setMaxConcurrent(1);
    t.check(mgr.maxConcurrent() == 1, "limit stored");

    std::mutex m;
    int maxRunning = 0;
    QObject::connect(
        &mgr, &TransferManager::jobsChanged, &mgr,
        [&] {
            int running = 0;
            for (const auto &j : mgr.listJobs())
                running += j.status == Status::InProgress ? 1 : 0;
            std::lock_guard<std::mutex> lk(m);
            maxRunning = std::max(maxRunning, running);
        },
        Qt::DirectConnection);

    std::vector<quint64> ids;
    for (int i = 0; i < 3; ++i) {
        auto c = connectedMock();
        c->addFile("/f.bin", std::string(200, 'q'));
        c->setChunkSize(20);
        c->setChunkDelay(std::chrono::milliseconds(3));
        ids.push_back(mgr.enqueueDownload(
            c, "/f.bin", tmp.filePath(QString("f%1.bin").arg(i))));
    }
    t.check(mgr.waitForIdle(10000), "gated jobs finish");
    for (quint64 id : ids)
        t.check(statusOf(mgr, id) == Status::Completed, "gated job completed");
    std::lock_guard<std::mutex> lk(m);
    t.check(maxRunning == 1, "never more than one job in progress");
}

void test_shared_client_serialized(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/a.bin", std::string(300, 'a'));
    client->addFile("/b.bin", std::string(300, 'b'));
    client->setChunkSize(30);
    client->setChunkDelay(std::chrono::milliseconds(2));

    TransferManager mgr;
    std::mutex m;
    int maxRunning = 0;
    QObject::connect(
        &mgr, &TransferManager::jobsChanged, &mgr,
        [&] {
            int running = 0;
            for (const auto &j : mgr.listJobs())
                running += j.status == Status::InProgress ? 1 : 0;
            std::lock_guard<std::mutex> lk(m);
            maxRunning = std::max(maxRunning, running);
        },
        Qt::DirectConnection);

    const quint64 a = mgr.enqueueDownload(client, "/a.bin", tmp.filePath("a"));
    const quint64 b = mgr.enqueueDownload(client, "/b.bin", tmp.filePath("b"));
    t.check(mgr.waitForIdle(5000), "shared-client jobs finish");
    t.check(statusOf(mgr, a) == Status::Completed &&
                statusOf(mgr, b) == Status::Completed,
            "both shared-client jobs completed");
    t.check(readAll(tmp.filePath("b")) == QByteArray(300, 'b'),
            "second job content intact");
    std::lock_guard<std::mutex> lk(m);
    t.check(maxRunning == 1, "one job at a time per client");
}

void test_overwrite_policies(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/doc.txt", "remote");
    const QString local = tmp.filePath("doc.txt");
    writeFile(local, "local");

    TransferManager mgr;
    mgr.setOverwritePolicy(TransferManager::OverwritePolicy::Skip);
    const quint64 skip = mgr.enqueueDownload(client, "/doc.txt", local);
    t.check(mgr.waitForIdle(5000), "skip job finishes");
    t.check(statusOf(mgr, skip) == Status::Completed, "skip completes");
    t.check(readAll(local) == "local", "skip keeps the existing file");
    auto skipped = mgr.job(skip);
    t.check(skipped && skipped->transferredBytes == 6 &&
                skipped->totalBytes == 6,
            "skipped download counts the remote size");
    t.check(skipped && skipped->progressPercent() == 100,
            "skipped download reports 100%");

    mgr.setOverwritePolicy(TransferManager::OverwritePolicy::Rename);
    mgr.enqueueDownload(client, "/doc.txt", local);
    t.check(mgr.waitForIdle(5000), "rename job finishes");
    t.check(readAll(local) == "local", "rename keeps the existing file");
    t.check(readAll(tmp.filePath("doc (1).txt")) == "remote",
            "rename writes a numbered copy");

    mgr.setOverwritePolicy(TransferManager::OverwritePolicy::Overwrite);
    mgr.enqueueDownload(client, "/doc.txt", local);
    t.check(mgr.waitForIdle(5000), "overwrite job finishes");
    t.check(readAll(local) == "remote", "overwrite replaces the file");

    const QString up = tmp.filePath("up.txt");
    writeFile(up, "new");
    client->addFile("/up.txt", "old");
    mgr.setOverwritePolicy(TransferManager::OverwritePolicy::Rename);
    mgr.enqueueUpload(client, up, "/up.txt");
    t.check(mgr.waitForIdle(5000), "rename upload finishes");
    t.check(client->fileContent("/up.txt") == std::string("old"),
            "remote original kept");
    t.check(client->fileContent("/up (1).txt") == std::string("new"),
            "remote numbered copy written");
}

void test_recursive_download_skip_counts_bytes(TestContext &t) {
    QTemporaryDir tmp;
    auto client = connectedMock();
    client->addFile("/tree/a.txt", std::string(10, 'a'));
    client->addFile("/tree/b.txt", std::string(20, 'b'));
    client->addFile("/tree/sub/c.txt", std::string(30, 'c'));
    const QString dest = tmp.filePath("out");
    t.check(writeFile(dest + "/a.txt", "mine"), "existing local file");

    TransferManager mgr;
    mgr.setOverwritePolicy(TransferManager::OverwritePolicy::Skip);
    const quint64 id = mgr.enqueueRecursiveDownload(client, "/tree", dest);
    t.check(mgr.waitForIdle(5000), "recursive skip job finishes");
    auto j = mgr.job(id);
    t.check(j && j->status == Status::Completed, "recursive skip completes");
    t.check(j && j->totalBytes == 60 && j->transferredBytes == 60,
            "skipped file counted towards progress");
    t.check(readAll(dest + "/a.txt") == "mine", "existing file untouched");
    t.check(readAll(dest + "/sub/c.txt") == QByteArray(30, 'c'),
            "other files downloaded");
}

void test_recursive_download_rejects_unsafe_names(TestContext &t) {
    const std::vector<std::pair<std::string, bool>> names = {
        {"../escape.txt", false},
        {"../../escape.txt", false},
        {"/tmp/abs-escape", true},
        {"sub/../../escape.txt", false},
        {"..", true},
    };
    for (const auto &n : names) {
        QTemporaryDir tmp;
        auto client = std::make_shared<InjectedEntryClient>("/tree", n.first,
                                                            n.second);
        OpError err;
        t.check(client->connect(err), "injected client connects");
        client->addFile("/tree/ok.txt", "fine");

        const QString dest = tmp.filePath("inner/out");
        TransferManager mgr;
        const quint64 id = mgr.enqueueRecursiveDownload(client, "/tree", dest);
        t.check(mgr.waitForIdle(5000), "unsafe listing job finishes");
        auto j = mgr.job(id);
        t.check(j && j->status == Status::Failed,
                "entry named '" + n.first + "' fails the job");
        t.check(j && j->error.contains("unsafe"), "error names the cause");
        t.check(!QFile::exists(tmp.filePath("inner/escape.txt")) &&
                    !QFile::exists(tmp.filePath("escape.txt")),
                "nothing written outside the destination");
        t.check(!QFile::exists(dest + "/ok.txt"),
                "no transfer starts before the walk is vetted");
    }
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_item_helpers(t);
    test_single_download(t);
    test_single_upload(t);
    test_recursive_download_progress(t);
    test_recursive_upload(t);
    test_cancel_download(t);
    test_cancel_recursive_upload(t);
    test_failure_isolation(t);
    test_concurrency_gate(t);
    test_shared_client_serialized(t);
    test_overwrite_policies(t);
    test_recursive_download_skip_counts_bytes(t);
    test_recursive_download_rejects_unsafe_names(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] portkeydrop_transfer_manager_tests\n";
    return EXIT_SUCCESS;
}
