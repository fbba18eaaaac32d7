/**
 * @file RecordIndexer.cpp
 * @brief Implementation of the concurrent record indexer.
 */

#include "RecordIndexer.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <mutex>
#include <thread>

namespace tfrecord
{
    std::vector<RecordLocator> scanContainer(
        const std::shared_ptr<const std::string>& path,
        bool checkIntegrity,
        FileHandleCache& cache
    )
    {
        RecordReader& reader = cache.open(*path);
        reader.rewind();

        std::vector<RecordLocator> locators;
        while (auto length = reader.readFrameLength(checkIntegrity))
        {
            uint64_t offset = reader.tell();
            reader.skipFramePayload(*length, checkIntegrity);
            locators.push_back(RecordLocator{path, offset, *length});
        }
        return locators;
    }

    RecordIndex buildRecordIndex(
        const std::vector<std::string>& paths,
        const DatasetInit& init,
        ResourceLimiter& limiter
    )
    {
        return buildRecordIndex(paths, init, limiter, scanContainer);
    }

    RecordIndex buildRecordIndex(
        const std::vector<std::string>& paths,
        const DatasetInit& init,
        ResourceLimiter& limiter,
        const ContainerScanner& scan
    )
    {
        if (paths.empty())
        {
            return RecordIndex();
        }

        size_t num_threads = std::min(init.effectiveWorkers(), paths.size());

        // One slot per input path, written by whichever worker claims it
        std::vector<std::vector<RecordLocator>> slots(paths.size());

        std::atomic<size_t> next_path_idx{0};
        std::atomic<bool> error_occurred{false};
        std::exception_ptr first_exception;
        std::mutex exception_mutex;

        auto worker = [&]() {
            try {
                while (!error_occurred.load(std::memory_order_acquire)) {
                    size_t idx = next_path_idx.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= paths.size()) break;

                    auto path = std::make_shared<const std::string>(paths[idx]);
                    FileHandleCache cache(limiter);
                    slots[idx] = scan(path, init.checkIntegrity, cache);
                    cache.release();

                    if (init.onFileIndexed) {
                        init.onFileIndexed(*path, slots[idx].size());
                    }
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(exception_mutex);
                if (!first_exception) {
                    first_exception = std::current_exception();
                }
                error_occurred.store(true, std::memory_order_release);
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(num_threads);
        try {
            for (size_t i = 0; i < num_threads; ++i) {
                workers.emplace_back(worker);
            }
        } catch (...) {
            // Thread creation failed; stop the workers that did start.
            error_occurred.store(true, std::memory_order_release);
            for (auto& t : workers) t.join();
            throw;
        }

        for (auto& t : workers) {
            t.join();
        }

        if (first_exception) {
            std::rethrow_exception(first_exception);
        }

        size_t total = 0;
        for (const auto& slot : slots) total += slot.size();

        std::vector<RecordLocator> locators;
        locators.reserve(total);
        for (auto& slot : slots) {
            std::move(slot.begin(), slot.end(), std::back_inserter(locators));
        }
        return RecordIndex(std::move(locators));
    }

} // namespace tfrecord
