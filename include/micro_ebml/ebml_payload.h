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
 * Typed payload decoding for leaf tags
 */

#ifndef MICRO_EBML_PAYLOAD_H
#define MICRO_EBML_PAYLOAD_H

#include <micro_ebml/ebml_specification.h>
#include <micro_ebml/ebml_tag.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace micro_ebml {

/**
 * @brief Byte-level problems found while decoding a leaf payload
 */
enum EbmlPayloadResult : int8_t {
    EBML_PAYLOAD_OK = 0,
    EBML_PAYLOAD_INVALID_INTEGER_SIZE = -1,  // Integer payload longer than 8 bytes
    EBML_PAYLOAD_INVALID_FLOAT_SIZE = -2,    // Float payload not 0, 4 or 8 bytes
    EBML_PAYLOAD_INVALID_UTF8 = -3           // Text payload is not valid UTF-8
};

/**
 * @brief Decode a big-endian unsigned integer
 *
 * A zero-length payload decodes to 0.
 */
EbmlPayloadResult decode_unsigned_int(const uint8_t* data, size_t length, uint64_t& value);

/**
 * @brief Decode a big-endian two's complement integer, sign-extending short payloads
 */
EbmlPayloadResult decode_signed_int(const uint8_t* data, size_t length, int64_t& value);

/**
 * @brief Decode a big-endian IEEE-754 float (4 or 8 bytes, or 0 bytes for 0.0)
 */
EbmlPayloadResult decode_float(const uint8_t* data, size_t length, double& value);

/**
 * @brief Strictly validate UTF-8 and copy it into value
 *
 * Overlong encodings, surrogates, code points above U+10FFFF and truncated
 * sequences are rejected. value is left untouched on failure.
 */
EbmlPayloadResult decode_utf8(const uint8_t* data, size_t length, std::string& value);

/**
 * @brief Decode a leaf payload and build its tag value through the specification
 *
 * Binary payloads are offered to the specification's get_binary_tag() first and
 * fall back to get_raw_tag(). If the specification cannot build a value for a
 * successfully decoded payload, ebml_specification_defect() aborts the process.
 *
 * @param spec Specification used to build the tag
 * @param id Tag id
 * @param type Declared leaf type (must not be EBML_TYPE_MASTER)
 * @param data Exactly the tag's payload bytes
 * @param length Payload length
 * @param tag Output: the built tag (only set when EBML_PAYLOAD_OK is returned)
 */
EbmlPayloadResult decode_tag_payload(const EbmlSpecification& spec, uint64_t id,
                                     EbmlDataType type, const uint8_t* data, size_t length,
                                     EbmlTagPtr& tag);

/**
 * @brief Human-readable description of a payload result
 */
const char* payload_result_message(EbmlPayloadResult result);

}  // namespace micro_ebml

#endif  // MICRO_EBML_PAYLOAD_H
