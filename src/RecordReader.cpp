/**
 * @file RecordReader.cpp
 * @brief Implementation of the RecordReader class.
 */

#include "RecordReader.hpp"
#include "tfrecord/Errors.hpp"
#include "utils/BinaryIO.hpp"
#include "utils/Crc32c.hpp"
#include <filesystem>
#include <system_error>

namespace tfrecord
{

// --- Constructor / Destructor ---

RecordReader::RecordReader(const std::string& filepath)
    : m_path(filepath)
{
    m_fileStream.open(filepath, std::ios::binary);
    if (!m_fileStream.is_open())
    {
        throw IoError("Failed to open file: " + filepath);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(filepath, ec);
    if (ec)
    {
        throw IoError("Failed to stat file '" + filepath + "': " + ec.message());
    }
    m_fileSize = static_cast<uint64_t>(size);
}

RecordReader::~RecordReader()
{
    if (m_fileStream.is_open()) m_fileStream.close();
}

// --- Low-Level I/O ---

uint64_t RecordReader::readSome(uint8_t* buffer, uint64_t length)
{
    if (length == 0) return 0;

    m_fileStream.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
    if (m_fileStream.bad())
    {
        throw IoError("Read failed in " + m_path);
    }

    auto got = static_cast<uint64_t>(m_fileStream.gcount());
    if (got < length)
    {
        // Short read leaves eof/fail set; keep the stream usable for tell()/seek.
        m_fileStream.clear();
    }
    return got;
}

void RecordReader::ensureFrameFits(uint64_t length)
{
    uint64_t pos = tell();
    uint64_t remaining = pos < m_fileSize ? m_fileSize - pos : 0;
    if (length > remaining || remaining - length < kFrameFooterSize)
    {
        throw CorruptionError(
            "Truncated payload in " + describe(pos) + ": frame declares " +
            std::to_string(length) + " bytes but only " +
            std::to_string(remaining) + " remain");
    }
}

std::string RecordReader::describe(uint64_t offset) const
{
    return "'" + m_path + "' at offset " + std::to_string(offset);
}

// --- Frame Primitives ---

std::optional<uint64_t> RecordReader::readFrameLength(bool checked)
{
    uint64_t start = tell();
    uint8_t header[kFrameHeaderSize];

    uint64_t got = readSome(header, 8);
    if (got == 0)
    {
        return std::nullopt; // Clean end of container
    }
    if (got < 8)
    {
        throw CorruptionError("Truncated length field in " + describe(start));
    }
    if (readSome(header + 8, 4) < 4)
    {
        throw CorruptionError("Truncated length checksum in " + describe(start));
    }

    uint64_t length = utils::readLeUint64(header);
    if (checked)
    {
        uint32_t expected = utils::readLeUint32(header + 8);
        if (utils::maskedCrc32c(header, 8) != expected)
        {
            throw CorruptionError("Length checksum mismatch in " + describe(start));
        }
    }
    return length;
}

void RecordReader::readFramePayload(std::vector<uint8_t>& buffer, uint64_t length, bool checked)
{
    ensureFrameFits(length);
    uint64_t start = tell();

    buffer.resize(static_cast<size_t>(length));
    if (readSome(buffer.data(), length) < length)
    {
        throw CorruptionError("Truncated payload in " + describe(start));
    }

    uint8_t footer[kFrameFooterSize];
    if (readSome(footer, kFrameFooterSize) < kFrameFooterSize)
    {
        throw CorruptionError("Truncated payload checksum in " + describe(start));
    }

    if (checked)
    {
        uint32_t expected = utils::readLeUint32(footer);
        if (utils::maskedCrc32c(buffer.data(), buffer.size()) != expected)
        {
            throw CorruptionError("Payload checksum mismatch in " + describe(start));
        }
    }
}

std::vector<uint8_t> RecordReader::readFramePayload(uint64_t length, bool checked)
{
    std::vector<uint8_t> buffer;
    readFramePayload(buffer, length, checked);
    return buffer;
}

void RecordReader::skipFramePayload(uint64_t length, bool checked)
{
    if (checked)
    {
        readFramePayload(m_scratch, length, true);
        return;
    }

    ensureFrameFits(length);
    seekTo(tell() + length + kFrameFooterSize);
}

// --- Sequential Access ---

bool RecordReader::nextRecord(std::vector<uint8_t>& payload, bool checked)
{
    auto length = readFrameLength(checked);
    if (!length)
    {
        return false;
    }
    readFramePayload(payload, *length, checked);
    return true;
}

void RecordReader::seekTo(uint64_t offset)
{
    if (offset > m_fileSize)
    {
        throw IoError("Seek past end of " + describe(offset));
    }

    // Clear any fail/eof bits before seeking
    m_fileStream.clear();
    m_fileStream.seekg(static_cast<std::streamoff>(offset));
    if (m_fileStream.fail())
    {
        throw IoError("Seek failed in " + describe(offset));
    }
}

uint64_t RecordReader::tell()
{
    m_fileStream.clear();
    auto pos = m_fileStream.tellg();
    if (pos < 0)
    {
        throw IoError("Failed to query position in '" + m_path + "'");
    }
    return static_cast<uint64_t>(pos);
}

} // namespace tfrecord
