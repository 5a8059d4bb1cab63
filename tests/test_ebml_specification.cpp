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
#include <gtest/gtest.h>

#include "test_helpers.h"

using namespace micro_ebml;
using namespace micro_ebml::test;

// ─── Lookup ─────────────────────────────────────────────────────────────────

TEST(EbmlSpecTableTest, DeclaredTypes) {
    const EbmlSpecTable& spec = test_specification();
    EXPECT_EQ(spec.size(), TEST_ELEMENT_COUNT);

    EXPECT_EQ(spec.get_tag_data_type(ID_MASTER_A), EBML_TYPE_MASTER);
    EXPECT_EQ(spec.get_tag_data_type(ID_UINT), EBML_TYPE_UNSIGNED_INT);
    EXPECT_EQ(spec.get_tag_data_type(ID_INT), EBML_TYPE_INTEGER);
    EXPECT_EQ(spec.get_tag_data_type(ID_FLOAT), EBML_TYPE_FLOAT);
    EXPECT_EQ(spec.get_tag_data_type(ID_TEXT), EBML_TYPE_UTF8);
    EXPECT_EQ(spec.get_tag_data_type(ID_BINARY), EBML_TYPE_BINARY);
}

TEST(EbmlSpecTableTest, UndeclaredIdIsBinary) {
    const EbmlSpecTable& spec = test_specification();
    EXPECT_EQ(spec.find(ID_UNDECLARED), nullptr);
    EXPECT_EQ(spec.get_tag_data_type(ID_UNDECLARED), EBML_TYPE_BINARY);
    EXPECT_EQ(spec.tag_name(ID_UNDECLARED), nullptr);

    const uint8_t data[] = {1, 2};
    EbmlTagPtr tag = spec.get_raw_tag(ID_UNDECLARED, data, sizeof(data));
    ASSERT_TRUE(tag);
    EXPECT_EQ(tag->kind(), EBML_TAG_RAW);
    EXPECT_EQ(tag->name(), nullptr);
}

// ─── Construction ───────────────────────────────────────────────────────────

TEST(EbmlSpecTableTest, MasterHalves) {
    const EbmlSpecTable& spec = test_specification();

    EbmlTagPtr start = spec.get_master_tag(ID_MASTER_A, EBML_MASTER_START);
    EbmlTagPtr end = spec.get_master_tag(ID_MASTER_A, EBML_MASTER_END);
    ASSERT_TRUE(start);
    ASSERT_TRUE(end);
    EXPECT_EQ(start->kind(), EBML_TAG_MASTER_START);
    EXPECT_EQ(end->kind(), EBML_TAG_MASTER_END);
    EXPECT_TRUE(start->is_master());
    EXPECT_EQ(static_cast<EbmlMasterTag&>(*end).marker(), EBML_MASTER_END);
    EXPECT_STREQ(start->name(), "MasterA");
}

TEST(EbmlSpecTableTest, TypeMismatchBuildsNothing) {
    const EbmlSpecTable& spec = test_specification();
    EXPECT_FALSE(spec.get_master_tag(ID_UINT, EBML_MASTER_START));
    EXPECT_FALSE(spec.get_unsigned_int_tag(ID_TEXT, 1));
    EXPECT_FALSE(spec.get_signed_int_tag(ID_UINT, -1));
    EXPECT_FALSE(spec.get_float_tag(ID_INT, 1.0));
    EXPECT_FALSE(spec.get_utf8_tag(ID_FLOAT, "x"));

    EbmlTagPtr tag = spec.get_float_tag(ID_FLOAT, 2.5);
    ASSERT_TRUE(tag);
    EXPECT_DOUBLE_EQ(static_cast<EbmlFloatTag&>(*tag).value(), 2.5);
}

TEST(EbmlSpecTableTest, BinaryDeclinedByDefault) {
    const uint8_t data[] = {1};
    EXPECT_FALSE(test_specification().get_binary_tag(ID_BINARY, data, sizeof(data)));
}

// ─── Hierarchy ──────────────────────────────────────────────────────────────

TEST(EbmlSpecTableTest, ChildrenByParent) {
    const EbmlSpecTable& spec = test_specification();
    EbmlMasterTag a(ID_MASTER_A, EBML_MASTER_START);
    EbmlMasterTag b(ID_MASTER_B, EBML_MASTER_START);
    EbmlMasterTag c(ID_MASTER_C, EBML_MASTER_START);

    EXPECT_TRUE(spec.is_child(a, ID_MASTER_B));
    EXPECT_TRUE(spec.is_child(a, ID_TEXT));
    EXPECT_FALSE(spec.is_child(a, ID_MASTER_C));
    EXPECT_FALSE(spec.is_child(a, ID_ROOT_UINT));
    EXPECT_FALSE(spec.is_child(c, ID_TEXT));

    // Declared under several parents
    EXPECT_TRUE(spec.is_child(a, ID_UINT));
    EXPECT_TRUE(spec.is_child(b, ID_UINT));
}

TEST(EbmlSpecTableTest, GlobalElementsFitAnywhere) {
    const EbmlSpecTable& spec = test_specification();
    EbmlMasterTag b(ID_MASTER_B, EBML_MASTER_START);
    EbmlMasterTag c(ID_MASTER_C, EBML_MASTER_START);
    EXPECT_TRUE(spec.is_child(b, ID_PADDING));
    EXPECT_TRUE(spec.is_child(c, ID_PADDING));
    EXPECT_FALSE(spec.is_child(c, ID_UNDECLARED));
}
