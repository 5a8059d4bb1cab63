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
 * Byte window over not-yet-consumed source data
 */

#ifndef MICRO_EBML_BUFFER_H
#define MICRO_EBML_BUFFER_H

#include <micro_ebml/ebml_source.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace micro_ebml {

/**
 * @brief Memory callbacks for the window storage
 *
 * Same contract as malloc/realloc/free. All three nullptr means the standard
 * functions are used.
 */
struct EbmlAllocator {
    void* (*alloc)(size_t size) = nullptr;
    void* (*realloc)(void* ptr, size_t size) = nullptr;
    void (*free)(void* ptr) = nullptr;
};

/**
 * @brief Result codes for EbmlBuffer::ensure_available()
 */
enum EbmlFillResult : uint8_t {
    EBML_FILL_OK,                // Requested bytes are resident
    EBML_FILL_END_OF_DATA,       // Source ended cleanly before enough bytes arrived
    EBML_FILL_WOULD_BLOCK,       // Source has no bytes right now; already read bytes are kept
    EBML_FILL_READ_ERROR,        // Source reported an I/O failure
    EBML_FILL_EXCEEDS_MAX,       // Request is larger than max_buffer_size
    EBML_FILL_ALLOCATION_FAILED  // Window storage could not be allocated
};

/**
 * @brief Growing window of unconsumed bytes pulled from a byte source
 *
 * Bytes are only dropped from the window by advance() or take(), which also
 * move the global offset forward. Bytes that have been consumed are never
 * retained: the window compacts unconsumed bytes to the front before growing.
 *
 * Memory allocation:
 * - Storage is allocated on the first ensure_available() call with data to fetch
 * - It starts at min_buffer_size and doubles as needed, capped at max_buffer_size
 * - Once allocated, storage persists for the lifetime of the object; reset() keeps it
 */
class EbmlBuffer {
public:
    EbmlBuffer(EbmlByteSource& source, size_t min_buffer_size, size_t max_buffer_size,
               const EbmlAllocator& allocator = EbmlAllocator{});
    ~EbmlBuffer();

    // Prevent copying (would cause double-free of owned storage)
    EbmlBuffer(const EbmlBuffer&) = delete;
    EbmlBuffer& operator=(const EbmlBuffer&) = delete;

    /**
     * @brief Make at least length unconsumed bytes resident
     *
     * Reads from the source only as many bytes as are missing. On
     * EBML_FILL_WOULD_BLOCK the bytes read so far stay in the window and a
     * later call resumes where this one stopped.
     */
    EbmlFillResult ensure_available(size_t length);

    /// Pointer to the first unconsumed byte (valid until the next non-const call)
    const uint8_t* data() const { return data_ + head_; }

    /// Number of resident unconsumed bytes
    size_t available() const { return tail_ - head_; }

    /// Discard the first length bytes (length must not exceed available())
    void advance(size_t length);

    /// Move the first length bytes into out and consume them
    void take(size_t length, std::vector<uint8_t>& out);

    /// Total number of bytes consumed since construction or reset()
    uint64_t current_offset() const { return offset_; }

    /// Drop all resident bytes and restart the offset at 0
    void reset();

    size_t capacity() const { return capacity_; }
    size_t max_buffer_size() const { return max_buffer_size_; }

#ifdef MICRO_EBML_READER_DEBUG
    size_t peak_capacity() const { return peak_capacity_; }
#endif

private:
    enum GrowBufferResult : uint8_t {
        GROW_OK,                // Buffer is large enough or was grown successfully
        GROW_EXCEEDS_MAX,       // Requested size exceeds max_buffer_size
        GROW_ALLOCATION_FAILED  // Memory allocation failed
    };

    // Grow storage to hold needed_size bytes
    GrowBufferResult grow_buffer(size_t needed_size);

    // Move unconsumed bytes to the front of the storage
    void compact();

    EbmlByteSource& source_;
    EbmlAllocator allocator_;

    uint8_t* data_{nullptr};
    size_t capacity_{0};
    size_t min_buffer_size_;
    size_t max_buffer_size_;
    size_t head_{0};  // First unconsumed byte
    size_t tail_{0};  // One past the last resident byte
    uint64_t offset_{0};

#ifdef MICRO_EBML_READER_DEBUG
    size_t peak_capacity_{0};
#endif
};

}  // namespace micro_ebml

#endif  // MICRO_EBML_BUFFER_H
