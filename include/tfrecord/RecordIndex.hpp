/**
 * @file RecordIndex.hpp
 * @brief Immutable, ordered list of record locations across container files.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tfrecord
{
    /**
     * @struct RecordLocator
     * @brief Identifies one record's payload within a container file.
     *
     * The path string is shared by every locator of the same file.
     */
    struct RecordLocator
    {
        std::shared_ptr<const std::string> path;
        uint64_t offset = 0; ///< Byte offset of the payload (after the length header)
        uint64_t length = 0; ///< Payload length in bytes

        bool operator==(const RecordLocator& other) const
        {
            return *path == *other.path && offset == other.offset && length == other.length;
        }
    };

    /**
     * @class RecordIndex
     * @brief Flat list of locators in input-path order, then on-disk order.
     *
     * Never mutated after construction; shared read-only between all
     * Dataset handles built from the same paths.
     */
    class RecordIndex
    {
    public:
        using const_iterator = std::vector<RecordLocator>::const_iterator;

        RecordIndex() = default;
        explicit RecordIndex(std::vector<RecordLocator> locators)
            : m_locators(std::move(locators)) {}

        /**
         * @brief Access a locator by its position.
         * @param index The index [0, size()).
         * @return Pointer to the locator, or nullptr if index is out of bounds.
         */
        const RecordLocator* at(size_t index) const
        {
            if (index < m_locators.size()) {
                return &m_locators[index];
            }
            return nullptr;
        }

        size_t size() const { return m_locators.size(); }
        bool empty() const { return m_locators.empty(); }

        const_iterator begin() const { return m_locators.begin(); }
        const_iterator end() const { return m_locators.end(); }

    private:
        std::vector<RecordLocator> m_locators;
    };

} // namespace tfrecord
