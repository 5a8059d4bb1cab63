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
 * Document specification interface and table-driven implementation
 */

#ifndef MICRO_EBML_SPECIFICATION_H
#define MICRO_EBML_SPECIFICATION_H

#include <micro_ebml/ebml_tag.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace micro_ebml {

/**
 * @brief Maps tag ids to their semantic type and builds tag values
 *
 * The reader consults the specification for every tag it reads. Construction
 * methods return nullptr when they cannot build a value. For master and typed
 * leaf ids whose declared type matches, that is a defect in the specification
 * itself and the reader aborts (see ebml_specification_defect()). Only
 * get_binary_tag() may decline as part of normal operation.
 *
 * Implementations must be usable from the thread driving the reader; the
 * reader only calls const methods.
 */
class EbmlSpecification {
public:
    virtual ~EbmlSpecification() = default;

    /// Declared data type of an id. Unknown ids should report EBML_TYPE_BINARY.
    virtual EbmlDataType get_tag_data_type(uint64_t id) const = 0;

    /// Build the start or end half of a master tag
    virtual EbmlTagPtr get_master_tag(uint64_t id, EbmlMasterMarker marker) const = 0;

    virtual EbmlTagPtr get_unsigned_int_tag(uint64_t id, uint64_t value) const = 0;
    virtual EbmlTagPtr get_signed_int_tag(uint64_t id, int64_t value) const = 0;
    virtual EbmlTagPtr get_float_tag(uint64_t id, double value) const = 0;
    virtual EbmlTagPtr get_utf8_tag(uint64_t id, std::string value) const = 0;

    /**
     * @brief Build a structured binary tag, or decline with nullptr
     *
     * Declining is not an error: the reader falls back to get_raw_tag().
     */
    virtual EbmlTagPtr get_binary_tag(uint64_t id, const uint8_t* data, size_t length) const;

    /// Build an opaque binary tag. Must always succeed.
    virtual EbmlTagPtr get_raw_tag(uint64_t id, const uint8_t* data, size_t length) const;

    /**
     * @brief Whether child_id is a valid direct child of the given master tag
     *
     * Only consulted while the innermost open container has an unknown size.
     */
    virtual bool is_child(const EbmlTag& parent, uint64_t child_id) const = 0;

    /// Element name used in diagnostics, or nullptr
    virtual const char* tag_name(uint64_t id) const;
};

// Parent id marking an element valid at the document root
constexpr uint64_t EBML_ROOT_PARENT = 0;
// Parent id marking an element valid inside every master (Void, CRC-32)
constexpr uint64_t EBML_GLOBAL_PARENT = ~0ULL;

/**
 * @brief One element definition of a table-driven specification
 *
 * The same id may appear more than once to allow several parents
 * (e.g. recursive elements such as ChapterAtom).
 */
struct EbmlElementSpec {
    uint64_t id;
    const char* name;
    EbmlDataType type;
    uint64_t parent_id;  // EBML_ROOT_PARENT, EBML_GLOBAL_PARENT or a master id
};

/**
 * @brief Specification built from a static table of element definitions
 *
 * Builds the generic tag classes of ebml_tag.h, named after the table entry.
 * Ids absent from the table are EBML_TYPE_BINARY and are emitted as raw tags.
 * Subclasses may override get_binary_tag() to add structured binary payloads.
 */
class EbmlSpecTable : public EbmlSpecification {
public:
    /**
     * @param elements Element definitions (copied; the name strings must outlive the table)
     * @param count Number of definitions
     */
    EbmlSpecTable(const EbmlElementSpec* elements, size_t count);

    EbmlDataType get_tag_data_type(uint64_t id) const override;
    EbmlTagPtr get_master_tag(uint64_t id, EbmlMasterMarker marker) const override;
    EbmlTagPtr get_unsigned_int_tag(uint64_t id, uint64_t value) const override;
    EbmlTagPtr get_signed_int_tag(uint64_t id, int64_t value) const override;
    EbmlTagPtr get_float_tag(uint64_t id, double value) const override;
    EbmlTagPtr get_utf8_tag(uint64_t id, std::string value) const override;
    EbmlTagPtr get_raw_tag(uint64_t id, const uint8_t* data, size_t length) const override;
    bool is_child(const EbmlTag& parent, uint64_t child_id) const override;
    const char* tag_name(uint64_t id) const override;

    /// First definition for an id, or nullptr if the id is not in the table
    const EbmlElementSpec* find(uint64_t id) const;

    size_t size() const { return elements_.size(); }

private:
    // Returns the definition only if the id is declared with the given type
    const EbmlElementSpec* find_typed(uint64_t id, EbmlDataType type) const;

    std::vector<EbmlElementSpec> elements_;  // Sorted by id (stable for duplicates)
};

/**
 * @brief Report a broken specification and abort
 *
 * Called when the specification declares an id as master or typed but
 * cannot build its tag value. This is a programming error in the
 * specification, not malformed input, so it never becomes an EbmlReadResult.
 *
 * @param id Offending tag id
 * @param what Kind of tag that could not be built (e.g. "master")
 */
[[noreturn]] void ebml_specification_defect(uint64_t id, const char* what);

}  // namespace micro_ebml

#endif  // MICRO_EBML_SPECIFICATION_H
