/**
 * @file Dataset.hpp
 * @brief The main user-facing API for reading records across many files.
 *
 * A Dataset is built once by DatasetInit::fromPaths(), which scans every
 * container concurrently and records where each payload lives. Records
 * are then served by position, or lazily in order through stream().
 */

#pragma once

#include "DatasetInit.hpp"
#include "RecordCodec.hpp"
#include "RecordIndex.hpp"
#include "ResourceLimiter.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfrecord
{
    template <typename T>
    class RecordStream;

    /**
     * @class Dataset
     * @brief Random and sequential access to an indexed set of records.
     *
     * The index and the open-file limiter are shared by every copy of a
     * Dataset. Each copy owns a private cache holding at most one open
     * file, so a handle must not be used from two threads at once, while
     * separate copies may be used freely in parallel.
     */
    class Dataset
    {
    public:
        /**
         * @brief Copies share the index and limiter but start with no open file.
         */
        Dataset(const Dataset& other);
        Dataset& operator=(const Dataset& other);
        Dataset(Dataset&& other) noexcept;
        Dataset& operator=(Dataset&& other) noexcept;

        /**
         * @brief Destructor. Closes the cached file and returns its permit.
         */
        ~Dataset();

        // --- Core API ---

        /**
         * @brief Gets the total number of records across all files.
         */
        size_t numRecords() const;

        /**
         * @brief Reads the payload of a record.
         *
         * @param index The 0-based record index.
         * @return The payload bytes, or std::nullopt if index >= numRecords().
         * @throws IoError if the file cannot be opened, positioned or read.
         * @throws CorruptionError if the file changed since indexing.
         */
        std::optional<std::vector<uint8_t>> getBytes(size_t index);

        /**
         * @brief Reads a record and decodes it through RecordCodec<T>.
         *
         * @return The decoded record, or std::nullopt if index >= numRecords().
         * @throws DecodeError if the codec rejects the payload.
         */
        template <typename T>
        std::optional<T> get(size_t index);

        /**
         * @brief Starts an independent, lazy pass over all records.
         *
         * The stream reads through its own copy of this handle and begins
         * at record 0 on every call.
         */
        template <typename T = std::vector<uint8_t>>
        RecordStream<T> stream() const;

        // --- Introspection ---

        const RecordIndex& index() const;
        const ResourceLimiter& resourceLimiter() const;

        /**
         * @brief Worker bound that was used to build the index.
         */
        size_t maxWorkers() const;

        /**
         * @brief Path of the file this handle currently holds open, if any.
         */
        std::optional<std::string> openFilePath() const;

    private:
        friend struct DatasetInit;

        struct State;
        struct Impl;

        explicit Dataset(std::shared_ptr<const State> state);

        // m_state must outlive m_impl: the cache inside Impl holds a permit
        // from the limiter owned by the state.
        std::shared_ptr<const State> m_state;
        std::unique_ptr<Impl> m_impl;
    };

    /**
     * @class RecordStream
     * @brief Finite, on-demand sequence of decoded records.
     *
     * Equivalent to calling get(0), get(1), ... until no record is left.
     * The cursor moves past a record before it is decoded, so the caller
     * may keep calling next() after a DecodeError.
     */
    template <typename T>
    class RecordStream
    {
    public:
        explicit RecordStream(Dataset dataset)
            : m_dataset(std::move(dataset)) {}

        /**
         * @brief Reads the next record.
         * @return The record, or std::nullopt once the stream is exhausted.
         */
        std::optional<T> next()
        {
            if (m_position >= m_dataset.numRecords())
            {
                return std::nullopt;
            }
            size_t index = m_position++;
            return m_dataset.template get<T>(index);
        }

        /**
         * @brief Index of the record the next call to next() will return.
         */
        size_t position() const { return m_position; }

        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator() = default;
            explicit iterator(RecordStream* stream) : m_stream(stream) { advance(); }

            reference operator*() const { return *m_current; }
            pointer operator->() const { return &*m_current; }

            iterator& operator++()
            {
                advance();
                return *this;
            }

            bool operator==(const iterator& other) const { return m_stream == other.m_stream; }
            bool operator!=(const iterator& other) const { return m_stream != other.m_stream; }

        private:
            void advance()
            {
                m_current = m_stream->next();
                if (!m_current) m_stream = nullptr;
            }

            RecordStream* m_stream = nullptr;
            std::optional<T> m_current;
        };

        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

    private:
        Dataset m_dataset;
        size_t m_position = 0;
    };

    // --- Template Implementations ---

    template <typename T>
    std::optional<T> Dataset::get(size_t index)
    {
        auto bytes = getBytes(index);
        if (!bytes)
        {
            return std::nullopt;
        }
        return decodeRecord<T>(std::move(*bytes));
    }

    template <typename T>
    RecordStream<T> Dataset::stream() const
    {
        return RecordStream<T>(*this);
    }

} // namespace tfrecord
