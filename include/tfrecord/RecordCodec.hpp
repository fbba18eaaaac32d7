/**
 * @file RecordCodec.hpp
 * @brief Customization point that turns raw payload bytes into a value.
 *
 * Specialize RecordCodec<T> for a schema type to read it through
 * Dataset::get<T>() and Dataset::stream<T>():
 *
 * @code
 *   template <> struct tfrecord::RecordCodec<MyExample> {
 *       static MyExample decode(std::vector<uint8_t>&& bytes);
 *   };
 * @endcode
 */

#pragma once

#include "Errors.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tfrecord
{
    template <typename T>
    struct RecordCodec; // Intentionally undefined

    /// @brief Raw payload, passed through untouched.
    template <>
    struct RecordCodec<std::vector<uint8_t>>
    {
        static std::vector<uint8_t> decode(std::vector<uint8_t>&& bytes)
        {
            return std::move(bytes);
        }
    };

    template <>
    struct RecordCodec<std::string>
    {
        static std::string decode(std::vector<uint8_t>&& bytes)
        {
            return std::string(bytes.begin(), bytes.end());
        }
    };

    /**
     * @brief Runs the codec for T, reporting any rejection as DecodeError.
     */
    template <typename T>
    T decodeRecord(std::vector<uint8_t>&& bytes)
    {
        try
        {
            return RecordCodec<T>::decode(std::move(bytes));
        }
        catch (const DecodeError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw DecodeError(e.what());
        }
    }

} // namespace tfrecord
