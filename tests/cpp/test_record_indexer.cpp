#include <gtest/gtest.h>
#include "RecordIndexer.hpp"
#include "tfrecord/Dataset.hpp"
#include "tfrecord/Errors.hpp"
#include "TestUtils.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tfrecord;
using namespace tfrecord::test_utils;

namespace {

// Offset of the n-th payload in a container of equally sized payloads
uint64_t payloadOffset(size_t n, size_t payloadSize) {
    return kFrameHeaderSize + n * (kFrameHeaderSize + payloadSize + kFrameFooterSize);
}

} // namespace

TEST(RecordIndexer, ScanContainerLocatesPayloads) {
    TempDir dir;
    const std::string path = dir.file("scan.tfrecord");
    writeContainer(path, {"r0", "r1", "r2"});

    ResourceLimiter limiter(1);
    FileHandleCache cache(limiter);
    auto shared = std::make_shared<const std::string>(path);
    auto locators = scanContainer(shared, true, cache);

    ASSERT_EQ(locators.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(*locators[i].path, path);
        EXPECT_EQ(locators[i].offset, payloadOffset(i, 2));
        EXPECT_EQ(locators[i].length, 2u);
    }
    // Locators compare by path contents, not by shared pointer identity
    auto samePath = std::make_shared<const std::string>(path);
    EXPECT_TRUE(locators[1] == (RecordLocator{samePath, payloadOffset(1, 2), 2}));
    EXPECT_EQ(limiter.inUse(), 1u); // Held until the cache lets go
}

TEST(RecordIndexer, EmptyPathListYieldsEmptyIndex) {
    ResourceLimiter limiter(std::nullopt);
    DatasetInit init;
    RecordIndex index = buildRecordIndex({}, init, limiter);
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.at(0), nullptr);
}

// A's scan does not start until B's has returned; the index must still list A first.
TEST(RecordIndexer, OrderIndependentOfCompletion) {
    TempDir dir;
    const std::string pathA = dir.file("a.tfrecord");
    const std::string pathB = dir.file("b.tfrecord");
    writeContainer(pathA, {"r0", "r1"});
    writeContainer(pathB, {"r2"});

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> scanned;

    ContainerScanner delayA = [&](const std::shared_ptr<const std::string>& path,
                                  bool checkIntegrity, FileHandleCache& cache) {
        if (*path == pathA) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::seconds(5), [&] { return !scanned.empty(); });
        }
        auto locators = scanContainer(path, checkIntegrity, cache);
        std::lock_guard<std::mutex> lock(mutex);
        scanned.push_back(*path);
        cv.notify_all();
        return locators;
    };

    DatasetInit init;
    init.maxWorkers = 2;
    ResourceLimiter limiter(std::nullopt);
    RecordIndex index = buildRecordIndex({pathA, pathB}, init, limiter, delayA);

    ASSERT_EQ(scanned.size(), 2u);
    EXPECT_EQ(scanned[0], pathB);
    EXPECT_EQ(scanned[1], pathA);

    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(*index.at(0)->path, pathA);
    EXPECT_EQ(index.at(0)->offset, payloadOffset(0, 2));
    EXPECT_EQ(*index.at(1)->path, pathA);
    EXPECT_EQ(index.at(1)->offset, payloadOffset(1, 2));
    EXPECT_EQ(*index.at(2)->path, pathB);
    EXPECT_EQ(index.at(2)->offset, payloadOffset(0, 2));
    EXPECT_EQ(limiter.inUse(), 0u);
}

TEST(RecordIndexer, ManyFilesKeepInputOrder) {
    TempDir dir;
    std::vector<std::string> paths;
    std::vector<std::string> expected;
    for (int f = 0; f < 12; ++f) {
        std::vector<std::string> payloads;
        for (int r = 0; r < (f % 4) + 1; ++r) {
            payloads.push_back("file" + std::to_string(f) + "-rec" + std::to_string(r));
        }
        paths.push_back(dir.file("shard" + std::to_string(f) + ".tfrecord"));
        writeContainer(paths.back(), payloads);
        expected.insert(expected.end(), payloads.begin(), payloads.end());
    }

    DatasetInit init;
    init.maxWorkers = 4;
    Dataset dataset = init.fromPaths(paths);

    ASSERT_EQ(dataset.numRecords(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(dataset.get<std::string>(i), expected[i]);
    }
}

TEST(RecordIndexer, WorkerBoundCapsConcurrentScans) {
    TempDir dir;
    std::vector<std::string> paths;
    for (int f = 0; f < 8; ++f) {
        paths.push_back(dir.file("w" + std::to_string(f) + ".tfrecord"));
        writeContainer(paths.back(), {"x", "y"});
    }

    // Each running scan holds one permit, so an unbounded limiter's peak
    // reflects how many scans ran at once.
    DatasetInit init;
    init.maxWorkers = 2;
    Dataset dataset = init.fromPaths(paths);

    EXPECT_EQ(dataset.numRecords(), 16u);
    EXPECT_EQ(dataset.maxWorkers(), 2u);
    EXPECT_LE(dataset.resourceLimiter().peakInUse(), 2u);
    EXPECT_EQ(dataset.resourceLimiter().inUse(), 0u);
}

TEST(RecordIndexer, OpenFileCapHonouredDuringBuild) {
    TempDir dir;
    std::vector<std::string> paths;
    for (int f = 0; f < 6; ++f) {
        paths.push_back(dir.file("c" + std::to_string(f) + ".tfrecord"));
        writeContainer(paths.back(), {"payload"});
    }

    DatasetInit init;
    init.maxOpenFiles = 1;
    init.maxWorkers = 4;
    Dataset dataset = init.fromPaths(paths);

    EXPECT_EQ(dataset.numRecords(), 6u);
    EXPECT_EQ(dataset.resourceLimiter().peakInUse(), 1u);
    EXPECT_EQ(dataset.resourceLimiter().inUse(), 0u);
}

TEST(RecordIndexer, CorruptPayloadFailsOnlyWhenChecked) {
    TempDir dir;
    const std::string good = dir.file("good.tfrecord");
    const std::string bad = dir.file("bad.tfrecord");
    writeContainer(good, {"fine", "also fine"});
    writeContainer(bad, {"abc", "def"});
    // Corrupt the second payload of the bad file
    flipByte(bad, payloadOffset(1, 3));

    DatasetInit checked;
    EXPECT_THROW(checked.fromPaths({good, bad, good}), CorruptionError);

    DatasetInit unchecked;
    unchecked.checkIntegrity = false;
    Dataset dataset = unchecked.fromPaths({good, bad, good});
    EXPECT_EQ(dataset.numRecords(), 6u);
}

TEST(RecordIndexer, FailureReleasesEveryPermit) {
    TempDir dir;
    const std::string good = dir.file("good.tfrecord");
    const std::string bad = dir.file("bad.tfrecord");
    writeContainer(good, {"fine"});
    writeContainer(bad, {"abc"});
    flipByte(bad, payloadOffset(0, 3));

    DatasetInit init;
    init.maxWorkers = 3;
    ResourceLimiter limiter(2);
    EXPECT_THROW(buildRecordIndex({good, bad, good, good}, init, limiter), CorruptionError);
    EXPECT_EQ(limiter.inUse(), 0u);
}

TEST(RecordIndexer, TruncatedFileFailsEvenUnchecked) {
    TempDir dir;
    const std::string path = dir.file("trunc.tfrecord");
    auto frame = encodeFrame("0123456789");
    frame.resize(frame.size() - 3);
    writeBytes(path, frame);

    DatasetInit init;
    init.checkIntegrity = false;
    EXPECT_THROW(init.fromPaths({path}), CorruptionError);
}

TEST(RecordIndexer, MissingFileIsIoError) {
    TempDir dir;
    const std::string good = dir.file("good.tfrecord");
    writeContainer(good, {"fine"});

    DatasetInit init;
    EXPECT_THROW(init.fromPaths({good, dir.file("nope.tfrecord")}), IoError);
}

TEST(RecordIndexer, ZeroBoundsRejected) {
    DatasetInit noFiles;
    noFiles.maxOpenFiles = 0;
    EXPECT_THROW(noFiles.fromPaths({}), std::invalid_argument);

    DatasetInit noWorkers;
    noWorkers.maxWorkers = 0;
    EXPECT_THROW(noWorkers.fromPaths({}), std::invalid_argument);
}

TEST(RecordIndexer, ReportsEachFile) {
    TempDir dir;
    const std::string a = dir.file("a.tfrecord");
    const std::string b = dir.file("b.tfrecord");
    writeContainer(a, {"1", "2", "3"});
    writeContainer(b, {});

    std::mutex mutex;
    std::map<std::string, size_t> reported;
    DatasetInit init;
    init.onFileIndexed = [&](const std::string& path, size_t records) {
        std::lock_guard<std::mutex> lock(mutex);
        reported[path] = records;
    };
    init.fromPaths({a, b});

    ASSERT_EQ(reported.size(), 2u);
    EXPECT_EQ(reported[a], 3u);
    EXPECT_EQ(reported[b], 0u);
}
