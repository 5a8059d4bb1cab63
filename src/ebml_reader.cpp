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
 * Container stack and iteration driver. See ebml_reader.h for the
 * emission protocol.
 */

#include <micro_ebml/ebml_reader.h>

#include <micro_ebml/ebml_vint.h>

#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace micro_ebml {

constexpr size_t EBML_DEFAULT_MIN_BUFFER_SIZE = 1024;
constexpr size_t EBML_LOG_MESSAGE_SIZE = 192;

static EbmlReaderConfig sanitize_config(const EbmlReaderConfig& config) {
    EbmlReaderConfig result = config;
    if (result.min_buffer_size == 0) {
        result.min_buffer_size = EBML_DEFAULT_MIN_BUFFER_SIZE;
    }
    if (result.max_buffer_size < result.min_buffer_size) {
        result.max_buffer_size = result.min_buffer_size;
    }
    return result;
}

static EbmlAllocator make_allocator(const EbmlReaderConfig& config) {
    EbmlAllocator allocator;
    allocator.alloc = config.alloc;
    allocator.realloc = config.realloc;
    allocator.free = config.free;
    return allocator;
}

EbmlReader::EbmlReader(EbmlByteSource& source, const EbmlSpecification& specification,
                       const EbmlReaderConfig& config)
    : specification_(specification),
      config_(sanitize_config(config)),
      buffer_(source, config_.min_buffer_size, config_.max_buffer_size, make_allocator(config_)) {}

// ==============================================================================
// PUBLIC API: State Management
// ==============================================================================

void EbmlReader::reset() {
    buffer_.reset();
    tag_stack_.clear();
    terminal_result_ = EBML_OK;
#ifdef MICRO_EBML_READER_DEBUG
    tags_emitted_ = 0;
    implicit_closures_ = 0;
    forced_closures_ = 0;
#endif
}

size_t EbmlReader::depth() const {
    size_t open = 0;
    for (const StackEntry& entry : tag_stack_) {
        if (entry.kind == StackEntry::PENDING_END) {
            open++;
        }
    }
    return open;
}

EbmlTagRange EbmlReader::tags() {
    return EbmlTagRange(*this);
}

// ==============================================================================
// PUBLIC API: Tag Iteration
// ==============================================================================

EbmlReadState EbmlReader::next() {
    EbmlReadState state;

    if (terminal_result_ < 0) {
        state.result = terminal_result_;
        state.message = "reader terminated by a previous error";
        return state;
    }

    // ======================================================================
    // PHASE A: TAGS OWED BY THE CONTAINER STACK
    // ======================================================================
    if (!tag_stack_.empty()) {
        const StackEntry& top = tag_stack_.back();
        if (top.kind == StackEntry::DEFERRED_NEXT || top_is_complete()) {
            pop_into(state);
            finish(state);
            return state;
        }
        // Still inside the container (or its size is unknown): read further
    }

    // ======================================================================
    // PHASE B: END OF DATA
    // ======================================================================
    EbmlFillResult fill = buffer_.ensure_available(1);
    if (fill == EBML_FILL_END_OF_DATA) {
        if (tag_stack_.empty()) {
            state.result = EBML_END_OF_STREAM;
            finish(state);
            return state;
        }

        // Close whatever is still open, one container per call
        const StackEntry& top = tag_stack_.back();
        if (top.kind == StackEntry::PENDING_END) {
            log(EBML_LOG_WARNING,
                "source ended at offset %" PRIu64 " with %zu open container(s), closing 0x%" PRIX64,
                current_offset(), depth(), top.tag->id());
#ifdef MICRO_EBML_READER_DEBUG
            forced_closures_++;
#endif
        }
        pop_into(state);
        finish(state);
        return state;
    }
    if (fill != EBML_FILL_OK) {
        fill_failed(fill, "unexpected end of source", state);
        finish(state);
        return state;
    }

    // ======================================================================
    // PHASE C: NEXT TAG FROM THE SOURCE
    // ======================================================================
    state = read_tag();
    finish(state);
    return state;
}

// ==============================================================================
// PRIVATE HELPERS: Tag Reading
// ==============================================================================

EbmlReadState EbmlReader::read_tag() {
    EbmlReadState state;

    // Nothing is consumed until the header (and a leaf's payload) is resident,
    // so a would-block source can be resumed by calling next() again
    TagHeader header;
    if (peek_tag_header(header, state) != InternalResult::OK) {
        return state;
    }

    EbmlDataType type = specification_.get_tag_data_type(header.id);
    EbmlTagPosition position{current_offset(), header.length, header.size};
    bool child = is_child(header.id);

    if (type == EBML_TYPE_MASTER) {
        EbmlTagPtr end_tag = specification_.get_master_tag(header.id, EBML_MASTER_END);
        if (!end_tag) {
            ebml_specification_defect(header.id, "master");
        }
        EbmlTagPtr start_tag = specification_.get_master_tag(header.id, EBML_MASTER_START);
        if (!start_tag) {
            ebml_specification_defect(header.id, "master");
        }

        buffer_.advance(header.length);
        StackEntry pending{StackEntry::PENDING_END, std::move(end_tag), position};

        if (child) {
            tag_stack_.push_back(std::move(pending));
            state.result = EBML_OK;
            state.tag = std::move(start_tag);
            state.position = position;
            return state;
        }

        // Sibling of an unknown-size container: it takes the container's slot,
        // its start tag is queued and the container's end tag is returned now
        StackEntry closed = std::exchange(tag_stack_.back(), std::move(pending));
        tag_stack_.push_back(StackEntry{StackEntry::DEFERRED_NEXT, std::move(start_tag), position});

        log(EBML_LOG_DEBUG, "tag 0x%" PRIX64 " at offset %" PRIu64
                            " closes unknown-size container 0x%" PRIX64,
            header.id, position.offset, closed.tag->id());
#ifdef MICRO_EBML_READER_DEBUG
        implicit_closures_++;
#endif

        state.result = EBML_OK;
        state.tag = std::move(closed.tag);
        state.position = closed.position;
        return state;
    }

    // Leaf tag: the payload must have a declared size and fit in the window
    if (!header.size.known) {
        state.error_tag_id = header.id;
        fail(state, EBML_CORRUPTED_DATA, "unknown size for primitive tag not allowed");
        return state;
    }
    if (header.size.value > buffer_.max_buffer_size() - header.length) {
        state.error_tag_id = header.id;
        fail(state, EBML_TAG_TOO_LARGE, "leaf payload larger than max_buffer_size");
        return state;
    }

    size_t payload_size = static_cast<size_t>(header.size.value);
    EbmlFillResult fill = buffer_.ensure_available(header.length + payload_size);
    if (fill != EBML_FILL_OK) {
        state.error_tag_id = header.id;
        fill_failed(fill, "reached end of source but expecting more tag data", state);
        return state;
    }

    buffer_.advance(header.length);

    EbmlTagPtr tag;
    EbmlPayloadResult payload_result = decode_tag_payload(
        specification_, header.id, type, buffer_.data(), payload_size, tag);
    if (payload_result != EBML_PAYLOAD_OK) {
        state.error_tag_id = header.id;
        state.payload_error = payload_result;
        buffer_.take(payload_size, state.error_bytes);
        fail(state, EBML_CORRUPTED_TAG_DATA, payload_result_message(payload_result));
        return state;
    }
    buffer_.advance(payload_size);

    if (child) {
        state.result = EBML_OK;
        state.tag = std::move(tag);
        state.position = position;
        return state;
    }

    // Leaf outside an unknown-size container: queue it behind the container's end tag
    StackEntry closed = std::exchange(
        tag_stack_.back(), StackEntry{StackEntry::DEFERRED_NEXT, std::move(tag), position});

    log(EBML_LOG_DEBUG, "tag 0x%" PRIX64 " at offset %" PRIu64
                        " closes unknown-size container 0x%" PRIX64,
        header.id, position.offset, closed.tag->id());
#ifdef MICRO_EBML_READER_DEBUG
    implicit_closures_++;
#endif

    state.result = EBML_OK;
    state.tag = std::move(closed.tag);
    state.position = closed.position;
    return state;
}

EbmlReader::InternalResult EbmlReader::peek_tag_header(TagHeader& header, EbmlReadState& state) {
    // Step 1: tag id
    EbmlFillResult fill = buffer_.ensure_available(1);
    if (fill != EBML_FILL_OK) {
        return fill_failed(fill, "expected tag id, but reached end of source", state);
    }

    size_t id_length = vint_length(buffer_.data()[0]);
    if (id_length == 0) {
        fail(state, EBML_CORRUPTED_DATA, "invalid tag id: no VINT length marker");
        return InternalResult::FAILED;
    }

    fill = buffer_.ensure_available(id_length);
    if (fill != EBML_FILL_OK) {
        return fill_failed(fill, "expected tag id, but reached end of source", state);
    }

    uint64_t id = 0;
    size_t decoded_length = 0;
    if (read_tag_id(buffer_.data(), buffer_.available(), id, decoded_length) != EBML_VINT_OK) {
        fail(state, EBML_CORRUPTED_DATA, "invalid tag id");
        return InternalResult::FAILED;
    }

    // Step 2: tag size, directly after the id
    fill = buffer_.ensure_available(id_length + 1);
    if (fill != EBML_FILL_OK) {
        state.error_tag_id = id;
        return fill_failed(fill, "expected tag size, but reached end of source", state);
    }

    size_t size_length = vint_length(buffer_.data()[id_length]);
    if (size_length == 0) {
        state.error_tag_id = id;
        fail(state, EBML_CORRUPTED_DATA, "invalid tag size: no VINT length marker");
        return InternalResult::FAILED;
    }

    fill = buffer_.ensure_available(id_length + size_length);
    if (fill != EBML_FILL_OK) {
        state.error_tag_id = id;
        return fill_failed(fill, "expected tag size, but reached end of source", state);
    }

    EbmlSize size = EbmlSize::unknown();
    if (read_tag_size(buffer_.data() + id_length, buffer_.available() - id_length, size,
                      decoded_length) != EBML_VINT_OK) {
        state.error_tag_id = id;
        fail(state, EBML_CORRUPTED_DATA, "invalid tag size");
        return InternalResult::FAILED;
    }

    header.id = id;
    header.size = size;
    header.length = id_length + size_length;
    return InternalResult::OK;
}

EbmlReader::InternalResult EbmlReader::fill_failed(EbmlFillResult fill, const char* eof_message,
                                                   EbmlReadState& state) {
    switch (fill) {
        case EBML_FILL_OK:
            return InternalResult::OK;
        case EBML_FILL_WOULD_BLOCK:
            state.result = EBML_NEED_MORE_DATA;
            return InternalResult::NEED_MORE_DATA;
        case EBML_FILL_END_OF_DATA:
            fail(state, EBML_CORRUPTED_DATA, eof_message);
            break;
        case EBML_FILL_READ_ERROR:
            fail(state, EBML_READ_ERROR, "byte source reported a read error");
            break;
        case EBML_FILL_EXCEEDS_MAX:
            fail(state, EBML_TAG_TOO_LARGE, "tag larger than max_buffer_size");
            break;
        case EBML_FILL_ALLOCATION_FAILED:
            fail(state, EBML_ALLOCATION_FAILED, "window allocation failed");
            break;
    }
    return InternalResult::FAILED;
}

// ==============================================================================
// PRIVATE HELPERS: Container Stack
// ==============================================================================

bool EbmlReader::is_child(uint64_t tag_id) const {
    if (tag_stack_.empty()) {
        return true;  // Root level
    }
    const StackEntry& top = tag_stack_.back();
    if (top.kind == StackEntry::DEFERRED_NEXT) {
        return true;
    }
    // Known-size containers close by byte count only, whatever the id
    if (top.position.size.known) {
        return true;
    }
    return specification_.is_child(*top.tag, tag_id);
}

bool EbmlReader::top_is_complete() const {
    const StackEntry& top = tag_stack_.back();
    if (top.kind != StackEntry::PENDING_END || !top.position.size.known) {
        return false;
    }
    return current_offset() >= top.position.data_offset() + top.position.size.value;
}

void EbmlReader::pop_into(EbmlReadState& state) {
    StackEntry entry = std::move(tag_stack_.back());
    tag_stack_.pop_back();

    state.result = EBML_OK;
    state.tag = std::move(entry.tag);
    state.position = entry.position;
}

void EbmlReader::fail(EbmlReadState& state, EbmlReadResult result, const char* message) {
    state.result = result;
    state.message = message;
    state.tag.reset();
}

void EbmlReader::finish(EbmlReadState& state) {
    if (state.result == EBML_OK) {
#ifdef MICRO_EBML_READER_DEBUG
        tags_emitted_++;
#endif
        return;
    }
    if (state.is_error()) {
        terminal_result_ = state.result;
        log(EBML_LOG_ERROR, "%s at offset %" PRIu64 " (tag id 0x%" PRIX64 "): %s",
            read_result_name(state.result), current_offset(), state.error_tag_id,
            state.message ? state.message : "");
    }
}

void EbmlReader::log(EbmlLogLevel level, const char* format, ...) const {
    if (!config_.log || level < config_.log_level) {
        return;
    }

    char message[EBML_LOG_MESSAGE_SIZE];
    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    config_.log(level, message, config_.log_user_data);
}

// ==============================================================================
// Lazy sequence adapter
// ==============================================================================

EbmlTagIterator::EbmlTagIterator(EbmlReader* reader) : reader_(reader) {
    current_ = reader_->next();
    if (current_.result == EBML_END_OF_STREAM) {
        reader_ = nullptr;
    }
}

EbmlTagIterator& EbmlTagIterator::operator++() {
    if (!reader_) {
        return *this;
    }
    // An error is yielded once, then the sequence ends
    if (current_.is_error()) {
        reader_ = nullptr;
        return *this;
    }
    current_ = reader_->next();
    if (current_.result == EBML_END_OF_STREAM) {
        reader_ = nullptr;
    }
    return *this;
}

const char* read_result_name(EbmlReadResult result) {
    switch (result) {
        case EBML_OK:
            return "EBML_OK";
        case EBML_END_OF_STREAM:
            return "EBML_END_OF_STREAM";
        case EBML_NEED_MORE_DATA:
            return "EBML_NEED_MORE_DATA";
        case EBML_READ_ERROR:
            return "EBML_READ_ERROR";
        case EBML_CORRUPTED_DATA:
            return "EBML_CORRUPTED_DATA";
        case EBML_CORRUPTED_TAG_DATA:
            return "EBML_CORRUPTED_TAG_DATA";
        case EBML_TAG_TOO_LARGE:
            return "EBML_TAG_TOO_LARGE";
        case EBML_ALLOCATION_FAILED:
            return "EBML_ALLOCATION_FAILED";
    }
    return "EBML_UNKNOWN_RESULT";
}

}  // namespace micro_ebml
