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
 * Tag value types produced by the reader
 */

#ifndef MICRO_EBML_TAG_H
#define MICRO_EBML_TAG_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace micro_ebml {

/**
 * @brief Declared semantic type of a tag id, as reported by the specification
 */
enum EbmlDataType : uint8_t {
    EBML_TYPE_MASTER,        // Container of nested tags
    EBML_TYPE_UNSIGNED_INT,  // Big-endian unsigned integer (0-8 bytes)
    EBML_TYPE_INTEGER,       // Big-endian two's complement integer (0-8 bytes)
    EBML_TYPE_FLOAT,         // Big-endian IEEE-754 (0, 4 or 8 bytes)
    EBML_TYPE_UTF8,          // UTF-8 text
    EBML_TYPE_BINARY         // Opaque or specification-structured bytes
};

/**
 * @brief Concrete kind of an emitted tag value
 */
enum EbmlTagKind : uint8_t {
    EBML_TAG_MASTER_START,
    EBML_TAG_MASTER_END,
    EBML_TAG_UNSIGNED_INT,
    EBML_TAG_INTEGER,
    EBML_TAG_FLOAT,
    EBML_TAG_UTF8,
    EBML_TAG_BINARY,  // Structured binary built by the specification
    EBML_TAG_RAW      // Opaque bytes (fallback when the specification declines)
};

/**
 * @brief Selects which half of a master tag to construct
 */
enum EbmlMasterMarker : uint8_t {
    EBML_MASTER_START,
    EBML_MASTER_END
};

/**
 * @brief Declared size of a tag
 *
 * An EBML size is either an exact payload length or the reserved "unknown"
 * sentinel (all value bits set), which is only legal for master tags.
 */
struct EbmlSize {
    bool known;      // False for the unknown-size sentinel
    uint64_t value;  // Payload length in bytes (only meaningful if known)

    static EbmlSize known_size(uint64_t value) { return EbmlSize{true, value}; }
    static EbmlSize unknown() { return EbmlSize{false, 0}; }

    bool operator==(const EbmlSize& other) const {
        return known == other.known && (!known || value == other.value);
    }
    bool operator!=(const EbmlSize& other) const { return !(*this == other); }
};

/**
 * @brief Where an emitted tag sits in the byte stream
 *
 * For master end tags this is the position of the container being closed,
 * so the payload span of a known-size master is
 * [offset + header_size, offset + header_size + size.value).
 */
struct EbmlTagPosition {
    uint64_t offset;     // Absolute offset of the tag id field
    size_t header_size;  // Length of the id and size fields together
    EbmlSize size;       // Declared payload size

    uint64_t data_offset() const { return offset + header_size; }
};

/**
 * @brief Base class of every tag value handed to the caller
 *
 * Tag values are constructed by the specification and owned through
 * EbmlTagPtr. They move between the reader's container stack and the
 * caller; they are never shared.
 */
class EbmlTag {
public:
    virtual ~EbmlTag() = default;

    EbmlTag(const EbmlTag&) = delete;
    EbmlTag& operator=(const EbmlTag&) = delete;

    /// Tag id with its VINT length-marker bits intact (e.g. 0x1A45DFA3)
    uint64_t id() const { return id_; }
    EbmlTagKind kind() const { return kind_; }

    /// Element name from the specification, or nullptr when unnamed
    const char* name() const { return name_; }

    bool is_master() const {
        return kind_ == EBML_TAG_MASTER_START || kind_ == EBML_TAG_MASTER_END;
    }

protected:
    EbmlTag(uint64_t id, EbmlTagKind kind, const char* name)
        : id_(id), kind_(kind), name_(name) {}

private:
    uint64_t id_;
    EbmlTagKind kind_;
    const char* name_;
};

using EbmlTagPtr = std::unique_ptr<EbmlTag>;

class EbmlMasterTag : public EbmlTag {
public:
    EbmlMasterTag(uint64_t id, EbmlMasterMarker marker, const char* name = nullptr)
        : EbmlTag(id, marker == EBML_MASTER_START ? EBML_TAG_MASTER_START : EBML_TAG_MASTER_END,
                  name) {}

    EbmlMasterMarker marker() const {
        return kind() == EBML_TAG_MASTER_START ? EBML_MASTER_START : EBML_MASTER_END;
    }
};

class EbmlUnsignedIntTag : public EbmlTag {
public:
    EbmlUnsignedIntTag(uint64_t id, uint64_t value, const char* name = nullptr)
        : EbmlTag(id, EBML_TAG_UNSIGNED_INT, name), value_(value) {}

    uint64_t value() const { return value_; }

private:
    uint64_t value_;
};

class EbmlIntegerTag : public EbmlTag {
public:
    EbmlIntegerTag(uint64_t id, int64_t value, const char* name = nullptr)
        : EbmlTag(id, EBML_TAG_INTEGER, name), value_(value) {}

    int64_t value() const { return value_; }

private:
    int64_t value_;
};

class EbmlFloatTag : public EbmlTag {
public:
    EbmlFloatTag(uint64_t id, double value, const char* name = nullptr)
        : EbmlTag(id, EBML_TAG_FLOAT, name), value_(value) {}

    double value() const { return value_; }

private:
    double value_;
};

class EbmlUtf8Tag : public EbmlTag {
public:
    EbmlUtf8Tag(uint64_t id, std::string value, const char* name = nullptr)
        : EbmlTag(id, EBML_TAG_UTF8, name), value_(std::move(value)) {}

    const std::string& value() const { return value_; }

private:
    std::string value_;
};

/**
 * @brief Binary payload tag
 *
 * Specifications derive from this class to expose structured binary
 * payloads (see EbmlBlockTag). The raw bytes are always kept.
 */
class EbmlBinaryTag : public EbmlTag {
public:
    EbmlBinaryTag(uint64_t id, const uint8_t* data, size_t length, const char* name = nullptr)
        : EbmlBinaryTag(id, EBML_TAG_BINARY, data, length, name) {}

    const std::vector<uint8_t>& data() const { return data_; }

protected:
    EbmlBinaryTag(uint64_t id, EbmlTagKind kind, const uint8_t* data, size_t length,
                  const char* name)
        : EbmlTag(id, kind, name), data_(data, data + length) {}

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief Opaque binary payload the specification has no structure for
 */
class EbmlRawTag : public EbmlBinaryTag {
public:
    EbmlRawTag(uint64_t id, const uint8_t* data, size_t length, const char* name = nullptr)
        : EbmlBinaryTag(id, EBML_TAG_RAW, data, length, name) {}
};

}  // namespace micro_ebml

#endif  // MICRO_EBML_TAG_H
