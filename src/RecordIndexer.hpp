/**
 * @file RecordIndexer.hpp
 * @brief Internal concurrent scan of container files into a RecordIndex.
 */

#pragma once

#include "tfrecord/DatasetInit.hpp"
#include "tfrecord/RecordIndex.hpp"
#include "tfrecord/ResourceLimiter.hpp"
#include "FileHandleCache.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tfrecord
{
    /**
     * @brief Walks every frame of one container and records its payload location.
     *
     * The file is opened through @p cache, so the scan holds one limiter
     * permit until the cache is released or destroyed.
     *
     * @throws IoError, CorruptionError
     */
    std::vector<RecordLocator> scanContainer(
        const std::shared_ptr<const std::string>& path,
        bool checkIntegrity,
        FileHandleCache& cache
    );

    /// @brief Signature of scanContainer(); lets callers wrap the per-file scan.
    using ContainerScanner = std::function<std::vector<RecordLocator>(
        const std::shared_ptr<const std::string>&, bool, FileHandleCache&)>;

    /**
     * @brief Scans all paths with a bounded pool of worker threads.
     *
     * Records are ordered by input path position, then by on-disk order,
     * independent of which worker finishes first. After the first failure
     * no further paths are started; scans already running are joined and
     * their results dropped before the failure is rethrown.
     *
     * @param paths Container files to index.
     * @param init Integrity flag, worker bound and progress hook.
     * @param limiter Open-file limiter; one permit is held per file scan.
     * @return The complete index.
     */
    RecordIndex buildRecordIndex(
        const std::vector<std::string>& paths,
        const DatasetInit& init,
        ResourceLimiter& limiter
    );

    /**
     * @brief Same as above, running @p scan on each file instead of scanContainer().
     */
    RecordIndex buildRecordIndex(
        const std::vector<std::string>& paths,
        const DatasetInit& init,
        ResourceLimiter& limiter,
        const ContainerScanner& scan
    );

} // namespace tfrecord
