/**
 * @file Errors.hpp
 * @brief Exception types raised while indexing and reading record containers.
 *
 * Out-of-range record access is not an error and is reported through
 * std::nullopt instead of an exception.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tfrecord
{
    /**
     * @class TFRecordError
     * @brief Common base for all errors raised by this library.
     */
    class TFRecordError : public std::runtime_error
    {
    public:
        explicit TFRecordError(const std::string& what)
            : std::runtime_error(what) {}
    };

    /**
     * @class IoError
     * @brief A file could not be opened, read or positioned.
     */
    class IoError : public TFRecordError
    {
    public:
        explicit IoError(const std::string& what)
            : TFRecordError(what) {}
    };

    /**
     * @class CorruptionError
     * @brief A frame started but could not be completed, or a checksum
     * did not match.
     */
    class CorruptionError : public TFRecordError
    {
    public:
        explicit CorruptionError(const std::string& what)
            : TFRecordError(what) {}
    };

    /**
     * @class DecodeError
     * @brief The record codec rejected the payload of a single record.
     */
    class DecodeError : public TFRecordError
    {
    public:
        explicit DecodeError(const std::string& what)
            : TFRecordError("failed to decode record: " + what) {}
    };

} // namespace tfrecord
