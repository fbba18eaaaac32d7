/**
 * @file RecordReader.hpp
 * @brief Frame-level reader for a single record container file.
 *
 * A container is a plain concatenation of frames:
 *
 *     uint64  length                 (little-endian)
 *     uint32  masked CRC-32C of the length bytes
 *     byte    payload[length]
 *     uint32  masked CRC-32C of the payload
 *
 * The reader exposes the two primitives the indexer and the dataset
 * build on (readFrameLength / readFramePayload) plus a sequential
 * nextRecord() convenience.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace tfrecord
{
    /// @brief Size of the length field plus its checksum.
    inline constexpr uint64_t kFrameHeaderSize = 8 + 4;

    /// @brief Size of the checksum that trails every payload.
    inline constexpr uint64_t kFrameFooterSize = 4;

    class RecordReader
    {
    public:
        /**
         * @brief Opens a container file for reading.
         * @param filepath Path to the container.
         * @throws IoError if the file cannot be opened or sized.
         */
        explicit RecordReader(const std::string& filepath);

        /**
         * @brief Destructor. Closes the file handle.
         */
        ~RecordReader();

        RecordReader(const RecordReader&) = delete;
        RecordReader& operator=(const RecordReader&) = delete;

        // --- Frame Primitives ---

        /**
         * @brief Reads the length field of the next frame.
         *
         * @param checked Verify the checksum that follows the length field.
         * @return The payload length, or std::nullopt if the reader sits
         * exactly at the end of the container.
         * @throws CorruptionError on a truncated header or checksum mismatch.
         * @throws IoError on a read failure.
         */
        std::optional<uint64_t> readFrameLength(bool checked);

        /**
         * @brief Reads a payload of a known length and its trailing checksum.
         *
         * @param length Payload length returned by readFrameLength().
         * @param checked Verify the payload checksum.
         * @return The payload bytes.
         * @throws CorruptionError if the payload is truncated or, when
         * checked, its checksum does not match.
         */
        std::vector<uint8_t> readFramePayload(uint64_t length, bool checked);

        /**
         * @brief Same as above, reusing the caller's buffer.
         */
        void readFramePayload(std::vector<uint8_t>& buffer, uint64_t length, bool checked);

        /**
         * @brief Moves past a payload without handing it to the caller.
         *
         * When checked, the payload is read and its checksum verified.
         * Otherwise the reader seeks past it, still rejecting frames that
         * run beyond the end of the file.
         */
        void skipFramePayload(uint64_t length, bool checked);

        // --- Sequential Access ---

        /**
         * @brief Reads the next whole frame.
         * @param payload Receives the payload bytes.
         * @param checked Verify both checksums.
         * @return true if a record was read, false at a clean end of container.
         */
        bool nextRecord(std::vector<uint8_t>& payload, bool checked = true);

        /**
         * @brief Seeks to an absolute byte offset.
         * @throws IoError if the offset is past the end or the seek fails.
         */
        void seekTo(uint64_t offset);

        /**
         * @brief Gets the current absolute byte offset in the file.
         */
        uint64_t tell();

        /**
         * @brief Seeks back to the first frame.
         */
        void rewind() { seekTo(0); }

        uint64_t fileSize() const { return m_fileSize; }
        const std::string& path() const { return m_path; }

    private:
        /**
         * @brief Reads up to @p length bytes.
         * @return The number of bytes actually read.
         */
        uint64_t readSome(uint8_t* buffer, uint64_t length);

        /**
         * @brief Checks that a payload of @p length bytes and its checksum
         * fit between the current position and the end of the file.
         * @throws CorruptionError otherwise.
         */
        void ensureFrameFits(uint64_t length);

        std::string describe(uint64_t offset) const;

        std::ifstream m_fileStream;
        std::string m_path;
        uint64_t m_fileSize = 0;
        std::vector<uint8_t> m_scratch; // Re-usable buffer for checked skips
    };

} // namespace tfrecord
