/**
 * @file ResourceLimiter.hpp
 * @brief Counting permit pool that bounds simultaneously open files.
 *
 * One limiter is created per index build and shared by the indexing
 * workers and by every Dataset handle derived from that build.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace tfrecord
{
    class ResourceLimiter
    {
    public:
        /**
         * @class Permit
         * @brief Scoped ownership of one slot; released on destruction.
         *
         * Move-only. A default-constructed or moved-from permit holds nothing.
         */
        class Permit
        {
        public:
            Permit() = default;
            ~Permit() { release(); }

            Permit(Permit&& other) noexcept : m_owner(other.m_owner) { other.m_owner = nullptr; }
            Permit& operator=(Permit&& other) noexcept
            {
                if (this != &other)
                {
                    release();
                    m_owner = other.m_owner;
                    other.m_owner = nullptr;
                }
                return *this;
            }

            Permit(const Permit&) = delete;
            Permit& operator=(const Permit&) = delete;

            /**
             * @brief Returns the slot early. Safe to call more than once.
             */
            void release() noexcept;

            bool held() const { return m_owner != nullptr; }

        private:
            friend class ResourceLimiter;
            explicit Permit(ResourceLimiter* owner) : m_owner(owner) {}

            ResourceLimiter* m_owner = nullptr;
        };

        /**
         * @brief Creates a limiter.
         * @param capacity Maximum concurrent permits, or std::nullopt for unbounded.
         * @throws std::invalid_argument if capacity is zero.
         */
        explicit ResourceLimiter(std::optional<size_t> capacity);

        ResourceLimiter(const ResourceLimiter&) = delete;
        ResourceLimiter& operator=(const ResourceLimiter&) = delete;

        /**
         * @brief Blocks until a slot is free, then takes it.
         *
         * Never blocks when the limiter is unbounded. The limiter must
         * outlive every permit it hands out.
         */
        Permit acquire();

        std::optional<size_t> capacity() const { return m_capacity; }

        /// @brief Number of permits currently held.
        size_t inUse() const;

        /// @brief Highest number of permits ever held at once.
        size_t peakInUse() const;

    private:
        void releaseSlot() noexcept;

        const std::optional<size_t> m_capacity;
        mutable std::mutex m_mutex;
        std::condition_variable m_slotFreed;
        size_t m_inUse = 0;
        size_t m_peakInUse = 0;
    };

} // namespace tfrecord
