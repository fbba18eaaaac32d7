/**
 * @file FileHandleCache.hpp
 * @brief Internal single-slot cache of one open container and its permit.
 *
 * Each Dataset handle owns one of these; the indexer uses one per file.
 * Not thread-safe: a cache belongs to exactly one handle or task.
 */

#pragma once

#include "RecordReader.hpp"
#include "tfrecord/ResourceLimiter.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tfrecord
{
    class FileHandleCache
    {
    public:
        explicit FileHandleCache(ResourceLimiter& limiter) : m_limiter(&limiter) {}
        ~FileHandleCache() = default;

        FileHandleCache(const FileHandleCache&) = delete;
        FileHandleCache& operator=(const FileHandleCache&) = delete;
        FileHandleCache(FileHandleCache&&) noexcept = default;
        FileHandleCache& operator=(FileHandleCache&&) noexcept = default;

        /**
         * @brief Returns a reader positioned somewhere in @p path.
         *
         * Reuses the cached reader when the path matches. Otherwise the
         * current file is closed and its permit returned before a new
         * permit is acquired (possibly blocking) and the file opened.
         *
         * @throws IoError if the file cannot be opened; the cache is left empty.
         */
        RecordReader& open(const std::string& path);

        /**
         * @brief Closes the cached file and returns its permit.
         */
        void release() noexcept { m_entry.reset(); }

        bool isOpen() const { return m_entry.has_value(); }

        std::optional<std::string> currentPath() const
        {
            if (m_entry) return m_entry->reader->path();
            return std::nullopt;
        }

    private:
        struct Entry
        {
            // Declared before the reader so the file closes before the slot frees.
            ResourceLimiter::Permit permit;
            std::unique_ptr<RecordReader> reader;
        };

        ResourceLimiter* m_limiter;
        std::optional<Entry> m_entry;
    };

} // namespace tfrecord
