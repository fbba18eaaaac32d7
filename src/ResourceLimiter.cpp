/**
 * @file ResourceLimiter.cpp
 * @brief Implementation of the ResourceLimiter permit pool.
 */

#include "tfrecord/ResourceLimiter.hpp"
#include <algorithm>
#include <stdexcept>

namespace tfrecord
{
    ResourceLimiter::ResourceLimiter(std::optional<size_t> capacity)
        : m_capacity(capacity)
    {
        if (m_capacity && *m_capacity == 0)
        {
            throw std::invalid_argument("ResourceLimiter capacity must be positive");
        }
    }

    ResourceLimiter::Permit ResourceLimiter::acquire()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_capacity)
        {
            m_slotFreed.wait(lock, [this] { return m_inUse < *m_capacity; });
        }
        ++m_inUse;
        m_peakInUse = std::max(m_peakInUse, m_inUse);
        return Permit(this);
    }

    size_t ResourceLimiter::inUse() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inUse;
    }

    size_t ResourceLimiter::peakInUse() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peakInUse;
    }

    void ResourceLimiter::releaseSlot() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inUse;
        }
        m_slotFreed.notify_one();
    }

    void ResourceLimiter::Permit::release() noexcept
    {
        if (m_owner)
        {
            m_owner->releaseSlot();
            m_owner = nullptr;
        }
    }

} // namespace tfrecord
