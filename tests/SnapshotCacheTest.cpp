#include <QtTest/QtTest>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <chrono>

#include "infra/JsonCodec.hpp"
#include "infra/SnapshotCache.hpp"

using namespace std::chrono_literals;
using et::mirror::domain::CacheSettings;
using et::mirror::domain::ErrorKind;
using et::mirror::domain::Snapshot;
using et::mirror::domain::TimePoint;
using et::mirror::infra::SnapshotCache;

namespace {

Snapshot sampleSnapshot(TimePoint createdAt) {
    Snapshot s;
    et::mirror::domain::Job a;
    a.id = "1";
    a.name = "A";
    s.jobs.push_back(a);
    s.graph.addNode("A");
    s.graph.addEdge("A", "B");
    s.createdAt = createdAt;
    return s;
}

} // namespace

class SnapshotCacheTest : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;
    TimePoint     now_{};

    CacheSettings settings(const QString& file, int hours = 24) const {
        CacheSettings s;
        s.path = dir_.filePath(file).toStdString();
        s.expiryHours = hours;
        return s;
    }

    et::mirror::domain::NowFn clock() {
        return [this] { return now_; };
    }

private slots:
    void init() {
        now_ = *et::mirror::infra::json::parseIsoTimestamp("2026-03-01T08:00:00Z");
    }

    void missingFileIsInvalidAndEmpty() {
        QVERIFY(dir_.isValid());
        SnapshotCache cache(settings("none.json"), clock());

        QVERIFY(!cache.isValid());
        const auto loaded = cache.load();
        QVERIFY(loaded.ok);
        QVERIFY(!loaded.snapshot.has_value());
    }

    void validRightAfterSave() {
        SnapshotCache cache(settings("fresh.json"), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);
        QVERIFY(cache.isValid());

        const auto loaded = cache.load();
        QVERIFY(loaded.ok);
        QVERIFY(loaded.snapshot.has_value());
        QCOMPARE(loaded.snapshot->jobs.size(), std::size_t(1));
        QVERIFY(loaded.snapshot->graph.hasEdge("A", "B"));
        QVERIFY(loaded.snapshot->createdAt == now_);
    }

    void expiresAfterTtl() {
        SnapshotCache cache(settings("ttl.json", 1), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);

        now_ += 59min;
        QVERIFY(cache.isValid());

        now_ += 2min;
        QVERIFY(!cache.isValid());

        // Stale content stays loadable; only validity changes.
        QVERIFY(cache.load().snapshot.has_value());
    }

    void saveCreatesParentDirectories() {
        SnapshotCache cache(settings("nested/deeper/cache.json"), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);
        QVERIFY(QFile::exists(dir_.filePath("nested/deeper/cache.json")));
    }

    void saveReplacesPreviousSnapshot() {
        SnapshotCache cache(settings("replace.json"), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);

        auto second = sampleSnapshot(now_ + 1h);
        second.jobs.clear();
        QVERIFY(cache.save(second).ok);

        const auto loaded = cache.load();
        QVERIFY(loaded.ok);
        QVERIFY(loaded.snapshot->jobs.empty());
        QVERIFY(loaded.snapshot->createdAt == now_ + 1h);
    }

    void invalidateRemovesFile() {
        SnapshotCache cache(settings("gone.json"), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);
        QVERIFY(cache.invalidate().ok);
        QVERIFY(!cache.isValid());
        QVERIFY(!QFile::exists(dir_.filePath("gone.json")));

        // Second invalidate on an absent file is fine.
        QVERIFY(cache.invalidate().ok);
    }

    void corruptFileIsCacheIoAndInvalid() {
        QFile f(dir_.filePath("corrupt.json"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("{\"timestamp\": \"2026-03-01T08:00:00Z\", \"jobs\": [");
        f.close();

        SnapshotCache cache(settings("corrupt.json"), clock());
        QVERIFY(!cache.isValid());

        const auto loaded = cache.load();
        QVERIFY(!loaded.ok);
        QCOMPARE(loaded.error.kind, ErrorKind::CacheIO);
    }

    void missingTimestampFallsBackToFileTime() {
        QFile f(dir_.filePath("legacy.json"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(R"({"jobs": [], "graph": {"nodes": [], "links": []}})");
        f.close();

        SnapshotCache cache(settings("legacy.json"), clock());
        const auto written = cache.writtenAt();
        QVERIFY(written.has_value());

        const auto mtimeMs = QFileInfo(f.fileName()).lastModified().toMSecsSinceEpoch();
        QVERIFY(*written == TimePoint(std::chrono::milliseconds(mtimeMs)));
    }

    void invalidExpiryUsesDefault() {
        SnapshotCache cache(settings("expiry.json", 0), clock());
        QVERIFY(cache.save(sampleSnapshot(now_)).ok);

        now_ += 23h;
        QVERIFY(cache.isValid());
        now_ += 2h;
        QVERIFY(!cache.isValid());
    }
};

QTEST_GUILESS_MAIN(SnapshotCacheTest)
#include "SnapshotCacheTest.moc"
