/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * Platform-independent little-endian encoding and decoding of the
 * fixed-width integers used by the record framing.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace tfrecord
{
namespace utils
{
    /**
     * @brief Reads a 32-bit little-endian unsigned integer from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     * @return The platform-native uint32_t.
     */
    inline uint32_t readLeUint32(const uint8_t* b)
    {
        return static_cast<uint32_t>(b[0]) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    /**
     * @brief Reads a 64-bit little-endian unsigned integer from a byte buffer.
     * @param b A pointer to at least 8 bytes of data.
     * @return The platform-native uint64_t.
     */
    inline uint64_t readLeUint64(const uint8_t* b)
    {
        return static_cast<uint64_t>(b[0]) |
               (static_cast<uint64_t>(b[1]) << 8) |
               (static_cast<uint64_t>(b[2]) << 16) |
               (static_cast<uint64_t>(b[3]) << 24) |
               (static_cast<uint64_t>(b[4]) << 32) |
               (static_cast<uint64_t>(b[5]) << 40) |
               (static_cast<uint64_t>(b[6]) << 48) |
               (static_cast<uint64_t>(b[7]) << 56);
    }

    /**
     * @brief Writes a 32-bit value as 4 little-endian bytes.
     * @param b Destination, at least 4 bytes.
     */
    inline void writeLeUint32(uint8_t* b, uint32_t value)
    {
        for (size_t i = 0; i < 4; ++i)
        {
            b[i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

    /**
     * @brief Writes a 64-bit value as 8 little-endian bytes.
     * @param b Destination, at least 8 bytes.
     */
    inline void writeLeUint64(uint8_t* b, uint64_t value)
    {
        for (size_t i = 0; i < 8; ++i)
        {
            b[i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

} // namespace utils
} // namespace tfrecord
