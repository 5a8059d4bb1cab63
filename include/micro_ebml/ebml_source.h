// Copyright 2025 Kevin Ahrendt
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/* microEbmlReader - Incremental EBML Tag Reader
 * Byte sources feeding the reader
 */

#ifndef MICRO_EBML_SOURCE_H
#define MICRO_EBML_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace micro_ebml {

/**
 * @brief Result codes for a single source read
 */
enum EbmlSourceResult : int8_t {
    EBML_SOURCE_OK = 0,              // bytes_read > 0 bytes were delivered
    EBML_SOURCE_END_OF_DATA = 1,     // Clean end of the stream (sticky)
    EBML_SOURCE_WOULD_BLOCK = 2,     // No bytes available right now, try again later
    EBML_SOURCE_READ_ERROR = -1      // I/O failure; the stream must not be resumed
};

struct EbmlSourceRead {
    EbmlSourceResult result;
    size_t bytes_read;
};

/**
 * @brief Abstract readable byte stream
 *
 * A blocking source waits inside read() until data arrives; a suspending
 * source returns EBML_SOURCE_WOULD_BLOCK instead, which the reader reports as
 * EBML_NEED_MORE_DATA without consuming anything.
 */
class EbmlByteSource {
public:
    virtual ~EbmlByteSource() = default;

    /**
     * @brief Read up to max_len bytes into dst
     *
     * @return EBML_SOURCE_OK with bytes_read in [1, max_len], or another result with bytes_read 0
     */
    virtual EbmlSourceRead read(uint8_t* dst, size_t max_len) = 0;
};

/**
 * @brief In-memory source fed by the caller in chunks
 *
 * Reports EBML_SOURCE_WOULD_BLOCK while all fed bytes have been read and
 * finish() has not been called; reports EBML_SOURCE_END_OF_DATA after finish()
 * once drained.
 *
 * Usage:
 * @code
 * EbmlMemorySource source;
 * EbmlReader reader(source, spec);
 * source.feed(chunk, chunk_len);
 * EbmlReadState state = reader.next();
 * if (state.result == EBML_NEED_MORE_DATA) {
 *     // feed more (or call source.finish()) and call next() again
 * }
 * @endcode
 */
class EbmlMemorySource : public EbmlByteSource {
public:
    EbmlMemorySource() = default;

    /// Source over a complete buffer (copied), already finished
    EbmlMemorySource(const uint8_t* data, size_t length);

    EbmlSourceRead read(uint8_t* dst, size_t max_len) override;

    /// Append bytes; ignored after finish()
    void feed(const uint8_t* data, size_t length);

    /// Mark the end of data
    void finish() { finished_ = true; }

    /**
     * @brief Cap the number of bytes delivered per read() call
     *
     * @param max_read_size Cap in bytes (0 means no cap)
     */
    void set_max_read_size(size_t max_read_size) { max_read_size_ = max_read_size; }

    /// Bytes fed but not yet read
    size_t pending() const { return data_.size() - read_position_; }

    bool finished() const { return finished_; }

private:
    std::vector<uint8_t> data_;
    size_t read_position_{0};
    size_t max_read_size_{0};
    bool finished_{false};
};

/**
 * @brief Blocking source over a stdio stream
 *
 * The FILE is not owned and is not closed by the source.
 */
class EbmlFileSource : public EbmlByteSource {
public:
    explicit EbmlFileSource(FILE* file) : file_(file) {}

    EbmlSourceRead read(uint8_t* dst, size_t max_len) override;

private:
    FILE* file_;
};

}  // namespace micro_ebml

#endif  // MICRO_EBML_SOURCE_H
