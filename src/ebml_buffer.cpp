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

#include <micro_ebml/ebml_buffer.h>

#include <cstdlib>
#include <cstring>

namespace micro_ebml {

EbmlBuffer::EbmlBuffer(EbmlByteSource& source, size_t min_buffer_size, size_t max_buffer_size,
                       const EbmlAllocator& allocator)
    : source_(source),
      allocator_(allocator),
      min_buffer_size_(min_buffer_size),
      max_buffer_size_(max_buffer_size) {
    // If only some callbacks are provided, fall back to all standard functions
    if (!allocator_.alloc || !allocator_.realloc || !allocator_.free) {
        allocator_ = EbmlAllocator{};
    }
}

EbmlBuffer::~EbmlBuffer() {
    if (!data_) {
        return;
    }
    if (allocator_.free) {
        allocator_.free(data_);
    } else {
        std::free(data_);
    }
}

void EbmlBuffer::reset() {
    head_ = 0;
    tail_ = 0;
    offset_ = 0;
}

void EbmlBuffer::advance(size_t length) {
    if (length > available()) {
        length = available();
    }
    head_ += length;
    offset_ += length;

    // Window drained: restart at the front so no compaction is needed later
    if (head_ == tail_) {
        head_ = 0;
        tail_ = 0;
    }
}

void EbmlBuffer::take(size_t length, std::vector<uint8_t>& out) {
    if (length > available()) {
        length = available();
    }
    out.assign(data(), data() + length);
    advance(length);
}

void EbmlBuffer::compact() {
    if (head_ == 0) {
        return;
    }
    size_t resident = available();
    if (resident > 0) {
        std::memmove(data_, data_ + head_, resident);
    }
    head_ = 0;
    tail_ = resident;
}

EbmlFillResult EbmlBuffer::ensure_available(size_t length) {
    if (available() >= length) {
        return EBML_FILL_OK;
    }
    if (length > max_buffer_size_) {
        return EBML_FILL_EXCEEDS_MAX;
    }

    // Make room for length bytes starting at the front of the window
    if (head_ + length > capacity_) {
        compact();
    }
    GrowBufferResult grow_result = grow_buffer(length);
    if (grow_result == GROW_EXCEEDS_MAX) {
        return EBML_FILL_EXCEEDS_MAX;
    }
    if (grow_result == GROW_ALLOCATION_FAILED) {
        return EBML_FILL_ALLOCATION_FAILED;
    }

    while (available() < length) {
        EbmlSourceRead read = source_.read(data_ + tail_, length - available());
        switch (read.result) {
            case EBML_SOURCE_OK:
                if (read.bytes_read == 0) {
                    return EBML_FILL_WOULD_BLOCK;
                }
                tail_ += read.bytes_read;
                break;
            case EBML_SOURCE_END_OF_DATA:
                return EBML_FILL_END_OF_DATA;
            case EBML_SOURCE_WOULD_BLOCK:
                return EBML_FILL_WOULD_BLOCK;
            case EBML_SOURCE_READ_ERROR:
                return EBML_FILL_READ_ERROR;
        }
    }

    return EBML_FILL_OK;
}

EbmlBuffer::GrowBufferResult EbmlBuffer::grow_buffer(size_t needed_size) {
    // Lazy allocation: allocate storage on first use
    if (!data_) {
        size_t initial_capacity = min_buffer_size_;
        if (initial_capacity < needed_size) {
            initial_capacity = needed_size;
        }
        if (initial_capacity > max_buffer_size_) {
            initial_capacity = max_buffer_size_;
        }

        void* ptr = allocator_.alloc ? allocator_.alloc(initial_capacity)
                                     : std::malloc(initial_capacity);
        if (!ptr) {
            return GROW_ALLOCATION_FAILED;
        }
        data_ = static_cast<uint8_t*>(ptr);
        capacity_ = initial_capacity;
#ifdef MICRO_EBML_READER_DEBUG
        peak_capacity_ = capacity_;
#endif
    }

    // Check if we need to grow
    if (needed_size <= capacity_) {
        return GROW_OK;
    }

    if (needed_size > max_buffer_size_) {
        return GROW_EXCEEDS_MAX;
    }

    // Calculate new capacity: double current size or use needed size, whichever is larger
    size_t new_capacity = capacity_ * 2;
    if (new_capacity < needed_size) {
        new_capacity = needed_size;
    }

    // Cap at maximum buffer size
    if (new_capacity > max_buffer_size_) {
        new_capacity = max_buffer_size_;
    }

    void* new_data = allocator_.realloc ? allocator_.realloc(data_, new_capacity)
                                        : std::realloc(data_, new_capacity);
    if (!new_data) {
        return GROW_ALLOCATION_FAILED;
    }

    data_ = static_cast<uint8_t*>(new_data);
    capacity_ = new_capacity;

#ifdef MICRO_EBML_READER_DEBUG
    if (new_capacity > peak_capacity_) {
        peak_capacity_ = new_capacity;
    }
#endif

    return GROW_OK;
}

}  // namespace micro_ebml
