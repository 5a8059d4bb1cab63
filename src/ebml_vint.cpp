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

#include <micro_ebml/ebml_vint.h>

namespace micro_ebml {

// VINTs are encoded like so (big-endian), the marker bit giving the length:
// 0b1xxx xxxx
// 0b01xx xxxx  xxxx xxxx
// ...
// 0b0000 0001  xxxx xxxx  (x 7 bytes)

size_t vint_length(uint8_t first_byte) {
    if (first_byte == 0) {
        return 0;
    }
    size_t length = 1;
    uint8_t mask = 0x80;
    while (!(first_byte & mask)) {
        mask >>= 1;
        length++;
    }
    return length;
}

EbmlVintResult read_vint(const uint8_t* data, size_t data_len, uint64_t& value, size_t& length) {
    if (data_len == 0) {
        return EBML_VINT_NEED_MORE_DATA;
    }

    size_t encoded_length = vint_length(data[0]);
    if (encoded_length == 0) {
        return EBML_VINT_INVALID;
    }
    if (data_len < encoded_length) {
        return EBML_VINT_NEED_MORE_DATA;
    }

    // Strip the marker bit from the first byte
    uint64_t result = data[0] & ((1U << (8 - encoded_length)) - 1);
    for (size_t i = 1; i < encoded_length; i++) {
        result = (result << 8) | data[i];
    }

    value = result;
    length = encoded_length;
    return EBML_VINT_OK;
}

EbmlVintResult read_tag_id(const uint8_t* data, size_t data_len, uint64_t& id, size_t& length) {
    uint64_t value = 0;
    EbmlVintResult result = read_vint(data, data_len, value, length);
    if (result != EBML_VINT_OK) {
        return result;
    }
    id = value + (1ULL << (7 * length));
    return EBML_VINT_OK;
}

EbmlVintResult read_tag_size(const uint8_t* data, size_t data_len, EbmlSize& size,
                             size_t& length) {
    uint64_t value = 0;
    EbmlVintResult result = read_vint(data, data_len, value, length);
    if (result != EBML_VINT_OK) {
        return result;
    }

    uint64_t all_ones = (1ULL << (7 * length)) - 1;
    size = (value == all_ones) ? EbmlSize::unknown() : EbmlSize::known_size(value);
    return EBML_VINT_OK;
}

}  // namespace micro_ebml
