/**
 * @file FileHandleCache.cpp
 * @brief Implementation of the FileHandleCache class.
 */

#include "FileHandleCache.hpp"

namespace tfrecord
{
    RecordReader& FileHandleCache::open(const std::string& path)
    {
        if (m_entry && m_entry->reader->path() == path)
        {
            return *m_entry->reader;
        }

        // Close the previous file first so its slot is free for this one.
        m_entry.reset();

        ResourceLimiter::Permit permit = m_limiter->acquire();
        auto reader = std::make_unique<RecordReader>(path);

        m_entry.emplace(Entry{std::move(permit), std::move(reader)});
        return *m_entry->reader;
    }

} // namespace tfrecord
