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

#include <micro_ebml/ebml_source.h>

#include <algorithm>
#include <cstring>

namespace micro_ebml {

// Once this many bytes have been read, the consumed prefix is dropped on the next feed()
constexpr size_t EBML_MEMORY_SOURCE_COMPACT_THRESHOLD = 4096;

EbmlMemorySource::EbmlMemorySource(const uint8_t* data, size_t length) {
    feed(data, length);
    finish();
}

void EbmlMemorySource::feed(const uint8_t* data, size_t length) {
    if (finished_ || length == 0 || !data) {
        return;
    }
    if (read_position_ >= EBML_MEMORY_SOURCE_COMPACT_THRESHOLD) {
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(read_position_));
        read_position_ = 0;
    }
    data_.insert(data_.end(), data, data + length);
}

EbmlSourceRead EbmlMemorySource::read(uint8_t* dst, size_t max_len) {
    size_t available = pending();
    if (available == 0) {
        return EbmlSourceRead{finished_ ? EBML_SOURCE_END_OF_DATA : EBML_SOURCE_WOULD_BLOCK, 0};
    }

    size_t to_copy = std::min(available, max_len);
    if (max_read_size_ > 0) {
        to_copy = std::min(to_copy, max_read_size_);
    }
    if (to_copy == 0) {
        return EbmlSourceRead{EBML_SOURCE_WOULD_BLOCK, 0};
    }

    std::memcpy(dst, data_.data() + read_position_, to_copy);
    read_position_ += to_copy;
    return EbmlSourceRead{EBML_SOURCE_OK, to_copy};
}

EbmlSourceRead EbmlFileSource::read(uint8_t* dst, size_t max_len) {
    if (!file_) {
        return EbmlSourceRead{EBML_SOURCE_READ_ERROR, 0};
    }
    size_t bytes_read = std::fread(dst, 1, max_len, file_);
    if (bytes_read > 0) {
        return EbmlSourceRead{EBML_SOURCE_OK, bytes_read};
    }
    if (std::ferror(file_)) {
        return EbmlSourceRead{EBML_SOURCE_READ_ERROR, 0};
    }
    return EbmlSourceRead{EBML_SOURCE_END_OF_DATA, 0};
}

}  // namespace micro_ebml
