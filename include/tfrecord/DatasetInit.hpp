/**
 * @file DatasetInit.hpp
 * @brief Options for building a Dataset over a list of container files.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tfrecord
{
    class Dataset;

    /**
     * @struct DatasetInit
     * @brief Index build configuration.
     *
     * Usage:
     * @code
     *   tfrecord::DatasetInit init;
     *   init.maxOpenFiles = 16;
     *   tfrecord::Dataset ds = init.fromPaths({"a.tfrecord", "b.tfrecord"});
     * @endcode
     */
    struct DatasetInit
    {
        /// @brief Called by a worker after one file has been scanned.
        using FileIndexedCallback = std::function<void(const std::string& path, size_t records)>;

        /**
         * @brief Verify frame checksums while indexing.
         * Random reads after the build never re-check them.
         */
        bool checkIntegrity = true;

        /**
         * @brief Cap on simultaneously open files, shared by indexing and
         * every Dataset handle of the build. Unbounded when unset.
         */
        std::optional<size_t> maxOpenFiles;

        /**
         * @brief Cap on concurrently running indexing workers.
         * Defaults to the hardware concurrency.
         */
        std::optional<size_t> maxWorkers;

        /**
         * @brief Optional progress hook; must be thread-safe.
         */
        FileIndexedCallback onFileIndexed;

        /**
         * @brief Indexes every path and returns a Dataset over all records.
         *
         * @param paths Container files; their order defines record order.
         * @return A Dataset with no file open.
         * @throws std::invalid_argument if maxOpenFiles or maxWorkers is zero.
         * @throws IoError, CorruptionError the first failure seen by any worker.
         */
        Dataset fromPaths(const std::vector<std::string>& paths) const;

        /**
         * @brief Worker count used for a build: maxWorkers, or the hardware
         * concurrency (4 if unknown).
         */
        size_t effectiveWorkers() const;
    };

} // namespace tfrecord
