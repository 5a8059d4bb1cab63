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

#include <micro_ebml/ebml_payload.h>

#include <cstring>
#include <utility>

namespace micro_ebml {

constexpr size_t EBML_MAX_INTEGER_SIZE = 8;

// Big-endian helpers
static inline uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

static inline uint64_t read_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(read_be32(p)) << 32) | read_be32(p + 4);
}

EbmlPayloadResult decode_unsigned_int(const uint8_t* data, size_t length, uint64_t& value) {
    if (length > EBML_MAX_INTEGER_SIZE) {
        return EBML_PAYLOAD_INVALID_INTEGER_SIZE;
    }
    uint64_t result = 0;
    for (size_t i = 0; i < length; i++) {
        result = (result << 8) | data[i];
    }
    value = result;
    return EBML_PAYLOAD_OK;
}

EbmlPayloadResult decode_signed_int(const uint8_t* data, size_t length, int64_t& value) {
    uint64_t raw = 0;
    EbmlPayloadResult result = decode_unsigned_int(data, length, raw);
    if (result != EBML_PAYLOAD_OK) {
        return result;
    }
    // Sign-extend when the payload is shorter than 8 bytes and its top bit is set
    if (length > 0 && length < EBML_MAX_INTEGER_SIZE && (data[0] & 0x80)) {
        raw |= ~0ULL << (8 * length);
    }
    value = static_cast<int64_t>(raw);
    return EBML_PAYLOAD_OK;
}

EbmlPayloadResult decode_float(const uint8_t* data, size_t length, double& value) {
    if (length == 0) {
        value = 0.0;
        return EBML_PAYLOAD_OK;
    }
    if (length == 4) {
        uint32_t bits = read_be32(data);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        value = f;
        return EBML_PAYLOAD_OK;
    }
    if (length == 8) {
        uint64_t bits = read_be64(data);
        std::memcpy(&value, &bits, sizeof(value));
        return EBML_PAYLOAD_OK;
    }
    return EBML_PAYLOAD_INVALID_FLOAT_SIZE;
}

static bool is_continuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

EbmlPayloadResult decode_utf8(const uint8_t* data, size_t length, std::string& value) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = data[i];
        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t sequence_length;
        uint32_t code_point;
        uint32_t min_code_point;
        if ((lead & 0xE0) == 0xC0) {
            sequence_length = 2;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            sequence_length = 3;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            sequence_length = 4;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return EBML_PAYLOAD_INVALID_UTF8;
        }

        if (length - i < sequence_length) {
            return EBML_PAYLOAD_INVALID_UTF8;  // Truncated sequence
        }
        for (size_t j = 1; j < sequence_length; j++) {
            if (!is_continuation(data[i + j])) {
                return EBML_PAYLOAD_INVALID_UTF8;
            }
            code_point = (code_point << 6) | (data[i + j] & 0x3F);
        }

        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return EBML_PAYLOAD_INVALID_UTF8;
        }
        i += sequence_length;
    }

    if (length == 0) {
        value.clear();
    } else {
        value.assign(reinterpret_cast<const char*>(data), length);
    }
    return EBML_PAYLOAD_OK;
}

EbmlPayloadResult decode_tag_payload(const EbmlSpecification& spec, uint64_t id,
                                     EbmlDataType type, const uint8_t* data, size_t length,
                                     EbmlTagPtr& tag) {
    EbmlPayloadResult result = EBML_PAYLOAD_OK;

    switch (type) {
        case EBML_TYPE_UNSIGNED_INT: {
            uint64_t value = 0;
            result = decode_unsigned_int(data, length, value);
            if (result != EBML_PAYLOAD_OK) {
                return result;
            }
            tag = spec.get_unsigned_int_tag(id, value);
            if (!tag) {
                ebml_specification_defect(id, "unsigned int");
            }
            break;
        }
        case EBML_TYPE_INTEGER: {
            int64_t value = 0;
            result = decode_signed_int(data, length, value);
            if (result != EBML_PAYLOAD_OK) {
                return result;
            }
            tag = spec.get_signed_int_tag(id, value);
            if (!tag) {
                ebml_specification_defect(id, "integer");
            }
            break;
        }
        case EBML_TYPE_FLOAT: {
            double value = 0.0;
            result = decode_float(data, length, value);
            if (result != EBML_PAYLOAD_OK) {
                return result;
            }
            tag = spec.get_float_tag(id, value);
            if (!tag) {
                ebml_specification_defect(id, "float");
            }
            break;
        }
        case EBML_TYPE_UTF8: {
            std::string value;
            result = decode_utf8(data, length, value);
            if (result != EBML_PAYLOAD_OK) {
                return result;
            }
            tag = spec.get_utf8_tag(id, std::move(value));
            if (!tag) {
                ebml_specification_defect(id, "utf8");
            }
            break;
        }
        case EBML_TYPE_BINARY: {
            tag = spec.get_binary_tag(id, data, length);
            if (!tag) {
                tag = spec.get_raw_tag(id, data, length);
            }
            if (!tag) {
                ebml_specification_defect(id, "raw");
            }
            break;
        }
        case EBML_TYPE_MASTER:
            // Masters carry no payload of their own; the reader never routes them here
            ebml_specification_defect(id, "master (as leaf)");
    }

    return EBML_PAYLOAD_OK;
}

const char* payload_result_message(EbmlPayloadResult result) {
    switch (result) {
        case EBML_PAYLOAD_OK:
            return "ok";
        case EBML_PAYLOAD_INVALID_INTEGER_SIZE:
            return "integer payload longer than 8 bytes";
        case EBML_PAYLOAD_INVALID_FLOAT_SIZE:
            return "float payload must be 0, 4 or 8 bytes";
        case EBML_PAYLOAD_INVALID_UTF8:
            return "payload is not valid UTF-8";
    }
    return "unknown payload error";
}

}  // namespace micro_ebml
