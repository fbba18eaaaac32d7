/**
 * @file Dataset.cpp
 * @brief Implementation of DatasetInit and the Dataset class.
 */

#include "tfrecord/Dataset.hpp"
#include "FileHandleCache.hpp"
#include "RecordIndexer.hpp"
#include <stdexcept>
#include <thread>

namespace tfrecord
{
    /**
     * @struct Dataset::State
     * @brief Immutable part of a dataset, shared by all copies.
     */
    struct Dataset::State
    {
        RecordIndex index;
        std::shared_ptr<ResourceLimiter> limiter;
        size_t maxWorkers;
    };

    /**
     * @struct Dataset::Impl
     * @brief Per-handle mutable part (PIMPL): the open-file cache.
     */
    struct Dataset::Impl
    {
        FileHandleCache cache;

        explicit Impl(ResourceLimiter& limiter) : cache(limiter) {}
    };

    // --- DatasetInit ---

    size_t DatasetInit::effectiveWorkers() const
    {
        if (maxWorkers)
        {
            return *maxWorkers;
        }
        size_t num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
        return num_threads;
    }

    Dataset DatasetInit::fromPaths(const std::vector<std::string>& paths) const
    {
        if (maxOpenFiles && *maxOpenFiles == 0)
        {
            throw std::invalid_argument("maxOpenFiles must be positive");
        }
        if (maxWorkers && *maxWorkers == 0)
        {
            throw std::invalid_argument("maxWorkers must be positive");
        }

        auto limiter = std::make_shared<ResourceLimiter>(maxOpenFiles);
        RecordIndex index = buildRecordIndex(paths, *this, *limiter);

        auto state = std::make_shared<const Dataset::State>(
            Dataset::State{std::move(index), std::move(limiter), effectiveWorkers()}
        );
        return Dataset(std::move(state));
    }

    // --- Construction / Assignment ---

    Dataset::Dataset(std::shared_ptr<const State> state)
        : m_state(std::move(state)),
          m_impl(std::make_unique<Impl>(*m_state->limiter))
    {
    }

    Dataset::Dataset(const Dataset& other)
        : m_state(other.m_state),
          m_impl(std::make_unique<Impl>(*m_state->limiter))
    {
    }

    Dataset& Dataset::operator=(const Dataset& other)
    {
        if (this != &other)
        {
            // Drop our file (and permit) while our limiter is still alive.
            m_impl.reset();
            m_state = other.m_state;
            m_impl = std::make_unique<Impl>(*m_state->limiter);
        }
        return *this;
    }

    Dataset::Dataset(Dataset&& other) noexcept = default;

    Dataset& Dataset::operator=(Dataset&& other) noexcept
    {
        if (this != &other)
        {
            m_impl = std::move(other.m_impl);
            m_state = std::move(other.m_state);
        }
        return *this;
    }

    Dataset::~Dataset()
    {
        // Members are destroyed in reverse order, so the cache goes first.
    }

    // --- Core API ---

    size_t Dataset::numRecords() const
    {
        return m_state->index.size();
    }

    std::optional<std::vector<uint8_t>> Dataset::getBytes(size_t index)
    {
        const RecordLocator* locator = m_state->index.at(index);
        if (!locator)
        {
            return std::nullopt;
        }

        RecordReader& reader = m_impl->cache.open(*locator->path);
        reader.seekTo(locator->offset);
        return reader.readFramePayload(locator->length, false);
    }

    // --- Introspection ---

    const RecordIndex& Dataset::index() const
    {
        return m_state->index;
    }

    const ResourceLimiter& Dataset::resourceLimiter() const
    {
        return *m_state->limiter;
    }

    size_t Dataset::maxWorkers() const
    {
        return m_state->maxWorkers;
    }

    std::optional<std::string> Dataset::openFilePath() const
    {
        return m_impl->cache.currentPath();
    }

} // namespace tfrecord
