/**
 * @file Crc32c.hpp
 * @brief CRC-32C (Castagnoli) and the masked form stored in record frames.
 *
 * Frames store masked checksums so that a CRC computed over data that
 * itself embeds CRCs does not degenerate.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace tfrecord
{
namespace utils
{
    namespace detail
    {
        constexpr uint32_t kCrc32cPoly = 0x82F63B78u;

        constexpr std::array<uint32_t, 256> makeCrc32cTable()
        {
            std::array<uint32_t, 256> table{};
            for (uint32_t i = 0; i < 256; ++i)
            {
                uint32_t crc = i;
                for (int j = 0; j < 8; ++j)
                {
                    crc = (crc & 1) ? (crc >> 1) ^ kCrc32cPoly : (crc >> 1);
                }
                table[i] = crc;
            }
            return table;
        }

        inline constexpr std::array<uint32_t, 256> kCrc32cTable = makeCrc32cTable();
    } // namespace detail

    /**
     * @brief Computes the CRC-32C checksum of a byte range.
     * @param data Pointer to the data.
     * @param size Number of bytes.
     * @return The unmasked checksum.
     */
    inline uint32_t crc32c(const uint8_t* data, size_t size) noexcept
    {
        uint32_t crc = 0xFFFFFFFFu;
        for (size_t i = 0; i < size; ++i)
        {
            crc = detail::kCrc32cTable[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
        }
        return ~crc;
    }

    constexpr uint32_t kCrcMaskDelta = 0xa282ead8u;

    /**
     * @brief Rotates right by 15 bits and adds a constant.
     */
    inline uint32_t maskCrc(uint32_t crc) noexcept
    {
        return ((crc >> 15) | (crc << 17)) + kCrcMaskDelta;
    }

    inline uint32_t unmaskCrc(uint32_t masked) noexcept
    {
        uint32_t rot = masked - kCrcMaskDelta;
        return (rot >> 17) | (rot << 15);
    }

    inline uint32_t maskedCrc32c(const uint8_t* data, size_t size) noexcept
    {
        return maskCrc(crc32c(data, size));
    }

} // namespace utils
} // namespace tfrecord
