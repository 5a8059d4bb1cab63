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
 * Reads EBML (RFC 8794) documents such as Matroska and WebM as a flat
 * sequence of tags from a byte source that may deliver data a chunk at a time.
 */

#ifndef MICRO_EBML_READER_H
#define MICRO_EBML_READER_H

#include <micro_ebml/ebml_buffer.h>
#include <micro_ebml/ebml_payload.h>
#include <micro_ebml/ebml_source.h>
#include <micro_ebml/ebml_specification.h>
#include <micro_ebml/ebml_tag.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace micro_ebml {

/**
 * @brief Result codes for EbmlReader::next()
 */
enum EbmlReadResult : int8_t {
    // Success codes
    EBML_OK = 0,              // A tag was produced
    EBML_END_OF_STREAM = 1,   // Source exhausted and every container closed
    EBML_NEED_MORE_DATA = 2,  // Source would block; nothing consumed, call next() again later

    // Data errors (the reader is terminated until reset())
    EBML_READ_ERROR = -1,          // Source reported an I/O failure
    EBML_CORRUPTED_DATA = -2,      // Malformed VINT, truncated header or unknown-size leaf
    EBML_CORRUPTED_TAG_DATA = -3,  // Leaf payload could not be decoded to its declared type

    // Resource errors
    EBML_TAG_TOO_LARGE = -4,     // Tag header plus leaf payload exceeds max_buffer_size
    EBML_ALLOCATION_FAILED = -5  // Memory allocation failed
};

/**
 * @brief Log severity for the configured log callback
 */
enum EbmlLogLevel : uint8_t {
    EBML_LOG_DEBUG = 0,
    EBML_LOG_INFO = 1,
    EBML_LOG_WARNING = 2,
    EBML_LOG_ERROR = 3
};

/**
 * @brief Configuration for EbmlReader
 *
 * Custom Allocator Requirements:
 * - alloc/realloc/free follow the malloc/realloc/free contract
 * - If only some callbacks are set, they are ignored and standard malloc/free are used
 *
 * Logging:
 * - log receives every message at or above log_level, already formatted
 * - nullptr disables logging; nothing is formatted in that case
 */
struct EbmlReaderConfig {
    size_t min_buffer_size = 1024;
    size_t max_buffer_size = 1024 * 1024;  // Largest tag header + leaf payload accepted

    // Memory callbacks - nullptr means use malloc/free/realloc
    void* (*alloc)(size_t size) = nullptr;
    void* (*realloc)(void* ptr, size_t size) = nullptr;
    void (*free)(void* ptr) = nullptr;

    // Log callback - nullptr means no logging
    void (*log)(EbmlLogLevel level, const char* message, void* user_data) = nullptr;
    void* log_user_data = nullptr;
    EbmlLogLevel log_level = EBML_LOG_WARNING;
};

/**
 * @brief Outcome of one EbmlReader::next() call
 *
 * tag and position are only valid when result == EBML_OK. The error fields
 * are only filled for error results.
 */
struct EbmlReadState {
    EbmlReadResult result{EBML_END_OF_STREAM};
    EbmlTagPtr tag;
    EbmlTagPosition position{0, 0, EbmlSize::known_size(0)};

    // Error details
    uint64_t error_tag_id{0};                         // Tag id involved, 0 if not known yet
    EbmlPayloadResult payload_error{EBML_PAYLOAD_OK};  // Set for EBML_CORRUPTED_TAG_DATA
    std::vector<uint8_t> error_bytes;                 // Offending payload (invalid UTF-8)
    const char* message{nullptr};                     // Static description of the error

    bool ok() const { return result == EBML_OK; }
    bool is_error() const { return result < 0; }
};

class EbmlTagRange;

/**
 * @brief Incremental EBML tag reader
 *
 * Produces one tag per next() call: master tags are reported as a start tag,
 * their children, then an end tag. End tags are emitted when a known-size
 * container's byte range is consumed, when a tag that is not a valid child
 * appears inside an unknown-size container, or when the source ends while
 * containers are still open (one end tag per call, innermost first).
 *
 * Thread Safety:
 * - Each EbmlReader instance must be used from a single thread only
 * - The source and specification must not be used concurrently elsewhere
 *
 * Suspension:
 * - When the source reports EBML_SOURCE_WOULD_BLOCK, next() returns
 *   EBML_NEED_MORE_DATA having consumed nothing; bytes already fetched stay in
 *   the window and the next call resumes the same tag
 * - At most one tag header and one leaf payload are read per call
 *
 * Errors:
 * - Data errors are returned in EbmlReadState and terminate the reader:
 *   further next() calls return the same result until reset()
 * - A broken specification (declares a type but cannot build the tag) aborts
 *   through ebml_specification_defect(); it is never reported as a result
 *
 * Usage:
 * @code
 * EbmlFileSource source(file);
 * EbmlReader reader(source, matroska_specification());
 * for (EbmlReadState& state : reader.tags()) {
 *     if (state.is_error()) {
 *         break;
 *     }
 *     // state.tag->id(), state.tag->kind(), state.position ...
 * }
 * @endcode
 */
class EbmlReader {
public:
    /**
     * @param source Byte source (must outlive the reader)
     * @param specification Specification used to type and build tags (must outlive the reader)
     * @param config Configuration struct (uses defaults if not specified)
     */
    EbmlReader(EbmlByteSource& source, const EbmlSpecification& specification,
               const EbmlReaderConfig& config = EbmlReaderConfig{});

    // Prevent copying (the window owns its storage)
    EbmlReader(const EbmlReader&) = delete;
    EbmlReader& operator=(const EbmlReader&) = delete;

    /**
     * @brief Produce the next tag, end of stream, a suspension or an error
     */
    EbmlReadState next();

    /**
     * @brief Lazy sequence over next(), for use in range-based for loops
     *
     * Each increment calls next() exactly once. The range ends after
     * EBML_END_OF_STREAM; an error state is yielded once and then the range ends.
     * EBML_NEED_MORE_DATA states are yielded so the caller can feed the source.
     */
    EbmlTagRange tags();

    /**
     * @brief Reset reader state for a new stream from the same source
     *
     * Drops open containers and resident bytes; keeps the window allocation.
     */
    void reset();

    /// Absolute offset of the next unconsumed byte
    uint64_t current_offset() const { return buffer_.current_offset(); }

    /// Number of open containers still owed an end tag
    size_t depth() const;

    /// Whether a previous call returned an error
    bool terminated() const { return terminal_result_ < 0; }

#ifdef MICRO_EBML_READER_DEBUG
    /**
     * @brief Get reader statistics
     * @param tags_emitted Output: number of tags returned with EBML_OK
     * @param implicit_closures Output: unknown-size containers closed by a non-child tag
     * @param forced_closures Output: containers closed because the source ended
     * @param peak_buffer_capacity Output: peak window capacity in bytes
     */
    void get_stats(size_t& tags_emitted, size_t& implicit_closures, size_t& forced_closures,
                   size_t& peak_buffer_capacity) const {
        tags_emitted = tags_emitted_;
        implicit_closures = implicit_closures_;
        forced_closures = forced_closures_;
        peak_buffer_capacity = buffer_.peak_capacity();
    }
#endif  // MICRO_EBML_READER_DEBUG

private:
    // One open container, or a tag queued behind the end tag of a container it closed
    struct StackEntry {
        enum Kind : uint8_t {
            PENDING_END,   // Inside a container whose end tag has not been emitted
            DEFERRED_NEXT  // Fully read tag to hand out before reading further
        };

        Kind kind;
        EbmlTagPtr tag;            // End tag (PENDING_END) or queued tag (DEFERRED_NEXT)
        EbmlTagPosition position;  // Position reported with tag
    };

    // Parsed id and size fields of the tag at the front of the window
    struct TagHeader {
        uint64_t id;
        EbmlSize size;
        size_t length;  // Bytes taken by the id and size fields
    };

    // Internal result codes for helper method communication
    enum class InternalResult : uint8_t {
        OK,              // Success, continue processing
        NEED_MORE_DATA,  // Source would block
        FAILED           // state holds the error
    };

    // Read a tag header, a leaf payload if any, and apply the container stack protocol
    EbmlReadState read_tag();

    // Peek the id and size fields without consuming them
    InternalResult peek_tag_header(TagHeader& header, EbmlReadState& state);

    // Map a window fill failure to a read state; eof_message is used for clean end of data
    InternalResult fill_failed(EbmlFillResult fill, const char* eof_message,
                               EbmlReadState& state);

    // Whether a tag with this id nests under the innermost open container
    bool is_child(uint64_t tag_id) const;

    // Whether the innermost open known-size container has been fully consumed
    bool top_is_complete() const;

    // Pop the top entry into state
    void pop_into(EbmlReadState& state);

    // Finish a call: logging, statistics and terminal bookkeeping
    void finish(EbmlReadState& state);

    void fail(EbmlReadState& state, EbmlReadResult result, const char* message);

    void log(EbmlLogLevel level, const char* format, ...) const
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    const EbmlSpecification& specification_;
    EbmlReaderConfig config_;
    EbmlBuffer buffer_;
    std::vector<StackEntry> tag_stack_;
    EbmlReadResult terminal_result_{EBML_OK};

#ifdef MICRO_EBML_READER_DEBUG
    size_t tags_emitted_{0};
    size_t implicit_closures_{0};
    size_t forced_closures_{0};
#endif
};

/**
 * @brief Input iterator over EbmlReader::next()
 */
class EbmlTagIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EbmlReadState;
    using difference_type = std::ptrdiff_t;
    using pointer = EbmlReadState*;
    using reference = EbmlReadState&;

    EbmlTagIterator() = default;  // End iterator
    explicit EbmlTagIterator(EbmlReader* reader);

    reference operator*() { return current_; }
    pointer operator->() { return &current_; }
    EbmlTagIterator& operator++();

    bool operator==(const EbmlTagIterator& other) const { return reader_ == other.reader_; }
    bool operator!=(const EbmlTagIterator& other) const { return reader_ != other.reader_; }

private:
    EbmlReader* reader_{nullptr};
    EbmlReadState current_;
};

class EbmlTagRange {
public:
    explicit EbmlTagRange(EbmlReader& reader) : reader_(reader) {}

    EbmlTagIterator begin() { return EbmlTagIterator(&reader_); }
    EbmlTagIterator end() { return EbmlTagIterator(); }

private:
    EbmlReader& reader_;
};

/**
 * @brief Name of a read result, for diagnostics
 */
const char* read_result_name(EbmlReadResult result);

}  // namespace micro_ebml

#endif  // MICRO_EBML_READER_H
