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

#include <micro_ebml/ebml_specification.h>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>

namespace micro_ebml {

// ==============================================================================
// EbmlSpecification defaults
// ==============================================================================

EbmlTagPtr EbmlSpecification::get_binary_tag(uint64_t /*id*/, const uint8_t* /*data*/,
                                             size_t /*length*/) const {
    return nullptr;
}

EbmlTagPtr EbmlSpecification::get_raw_tag(uint64_t id, const uint8_t* data,
                                          size_t length) const {
    return EbmlTagPtr(new EbmlRawTag(id, data, length, tag_name(id)));
}

const char* EbmlSpecification::tag_name(uint64_t /*id*/) const {
    return nullptr;
}

void ebml_specification_defect(uint64_t id, const char* what) {
    std::fprintf(stderr,
                 "microEbmlReader: bad specification implementation: tag id 0x%" PRIX64
                 " type was %s, but could not get tag\n",
                 id, what);
    std::abort();
}

// ==============================================================================
// EbmlSpecTable
// ==============================================================================

static bool element_id_less(const EbmlElementSpec& a, const EbmlElementSpec& b) {
    return a.id < b.id;
}

EbmlSpecTable::EbmlSpecTable(const EbmlElementSpec* elements, size_t count)
    : elements_(elements, elements + count) {
    std::stable_sort(elements_.begin(), elements_.end(), element_id_less);
}

const EbmlElementSpec* EbmlSpecTable::find(uint64_t id) const {
    EbmlElementSpec key{id, nullptr, EBML_TYPE_BINARY, EBML_ROOT_PARENT};
    auto it = std::lower_bound(elements_.begin(), elements_.end(), key, element_id_less);
    if (it == elements_.end() || it->id != id) {
        return nullptr;
    }
    return &*it;
}

const EbmlElementSpec* EbmlSpecTable::find_typed(uint64_t id, EbmlDataType type) const {
    const EbmlElementSpec* element = find(id);
    if (!element || element->type != type) {
        return nullptr;
    }
    return element;
}

EbmlDataType EbmlSpecTable::get_tag_data_type(uint64_t id) const {
    const EbmlElementSpec* element = find(id);
    return element ? element->type : EBML_TYPE_BINARY;
}

const char* EbmlSpecTable::tag_name(uint64_t id) const {
    const EbmlElementSpec* element = find(id);
    return element ? element->name : nullptr;
}

EbmlTagPtr EbmlSpecTable::get_master_tag(uint64_t id, EbmlMasterMarker marker) const {
    const EbmlElementSpec* element = find_typed(id, EBML_TYPE_MASTER);
    if (!element) {
        return nullptr;
    }
    return EbmlTagPtr(new EbmlMasterTag(id, marker, element->name));
}

EbmlTagPtr EbmlSpecTable::get_unsigned_int_tag(uint64_t id, uint64_t value) const {
    const EbmlElementSpec* element = find_typed(id, EBML_TYPE_UNSIGNED_INT);
    if (!element) {
        return nullptr;
    }
    return EbmlTagPtr(new EbmlUnsignedIntTag(id, value, element->name));
}

EbmlTagPtr EbmlSpecTable::get_signed_int_tag(uint64_t id, int64_t value) const {
    const EbmlElementSpec* element = find_typed(id, EBML_TYPE_INTEGER);
    if (!element) {
        return nullptr;
    }
    return EbmlTagPtr(new EbmlIntegerTag(id, value, element->name));
}

EbmlTagPtr EbmlSpecTable::get_float_tag(uint64_t id, double value) const {
    const EbmlElementSpec* element = find_typed(id, EBML_TYPE_FLOAT);
    if (!element) {
        return nullptr;
    }
    return EbmlTagPtr(new EbmlFloatTag(id, value, element->name));
}

EbmlTagPtr EbmlSpecTable::get_utf8_tag(uint64_t id, std::string value) const {
    const EbmlElementSpec* element = find_typed(id, EBML_TYPE_UTF8);
    if (!element) {
        return nullptr;
    }
    return EbmlTagPtr(new EbmlUtf8Tag(id, std::move(value), element->name));
}

EbmlTagPtr EbmlSpecTable::get_raw_tag(uint64_t id, const uint8_t* data, size_t length) const {
    return EbmlTagPtr(new EbmlRawTag(id, data, length, tag_name(id)));
}

bool EbmlSpecTable::is_child(const EbmlTag& parent, uint64_t child_id) const {
    EbmlElementSpec key{child_id, nullptr, EBML_TYPE_BINARY, EBML_ROOT_PARENT};
    auto range = std::equal_range(elements_.begin(), elements_.end(), key, element_id_less);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->parent_id == parent.id() || it->parent_id == EBML_GLOBAL_PARENT) {
            return true;
        }
    }
    return false;
}

}  // namespace micro_ebml
