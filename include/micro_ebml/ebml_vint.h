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
 * Variable-length integer (VINT) decoding per RFC 8794
 */

#ifndef MICRO_EBML_VINT_H
#define MICRO_EBML_VINT_H

#include <micro_ebml/ebml_tag.h>

#include <cstddef>
#include <cstdint>

namespace micro_ebml {

// Longest VINT accepted for both tag ids and tag sizes
constexpr size_t EBML_VINT_MAX_LENGTH = 8;

/**
 * @brief Result codes for VINT decoding
 */
enum EbmlVintResult : int8_t {
    EBML_VINT_OK = 0,              // Value decoded
    EBML_VINT_NEED_MORE_DATA = 1,  // Buffer shorter than the encoded length
    EBML_VINT_INVALID = -1         // First byte has no length-marker bit
};

/**
 * @brief Encoded length of a VINT from its first byte
 *
 * The length is one plus the number of leading zero bits before the marker bit.
 *
 * @return Length in bytes (1-8), or 0 if first_byte is 0x00
 */
size_t vint_length(uint8_t first_byte);

/**
 * @brief Decode the VINT at the front of data without consuming it
 *
 * @param data Encoded bytes
 * @param data_len Number of bytes available at data
 * @param value Output: value with the length-marker bit stripped
 * @param length Output: encoded length in bytes
 */
EbmlVintResult read_vint(const uint8_t* data, size_t data_len, uint64_t& value, size_t& length);

/**
 * @brief Decode a tag id, keeping its length-marker bit
 *
 * Ids keep the marker so that ids of different encoded lengths never collide,
 * i.e. the returned id is value + 2^(7 * length) (0x81 stays 0x81, 0x4286 stays 0x4286).
 */
EbmlVintResult read_tag_id(const uint8_t* data, size_t data_len, uint64_t& id, size_t& length);

/**
 * @brief Decode a tag size
 *
 * A value with every value bit set is the reserved unknown-size sentinel.
 */
EbmlVintResult read_tag_size(const uint8_t* data, size_t data_len, EbmlSize& size,
                             size_t& length);

}  // namespace micro_ebml

#endif  // MICRO_EBML_VINT_H
