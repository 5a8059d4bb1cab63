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
#include <gtest/gtest.h>

#include "test_helpers.h"

#include <string>

using namespace micro_ebml;
using namespace micro_ebml::test;

// ─── Integers ───────────────────────────────────────────────────────────────

TEST(EbmlPayloadTest, UnsignedIntBigEndian) {
    uint64_t value = 1;
    EXPECT_EQ(decode_unsigned_int(nullptr, 0, value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, 0u);

    const uint8_t data[] = {0x01, 0x02, 0x03};
    EXPECT_EQ(decode_unsigned_int(data, sizeof(data), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, 0x010203u);

    const uint8_t max[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(decode_unsigned_int(max, sizeof(max), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, UINT64_MAX);
}

TEST(EbmlPayloadTest, SignedIntSignExtends) {
    int64_t value = 0;

    const uint8_t minus_one[] = {0xFF};
    EXPECT_EQ(decode_signed_int(minus_one, sizeof(minus_one), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, -1);

    const uint8_t min16[] = {0x80, 0x00};
    EXPECT_EQ(decode_signed_int(min16, sizeof(min16), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, -32768);

    const uint8_t positive[] = {0x7F, 0xFF};
    EXPECT_EQ(decode_signed_int(positive, sizeof(positive), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, 32767);

    const uint8_t full[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE};
    EXPECT_EQ(decode_signed_int(full, sizeof(full), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, -2);
}

TEST(EbmlPayloadTest, IntegerLongerThanEightBytesRejected) {
    const uint8_t data[9] = {0};
    uint64_t unsigned_value = 0;
    int64_t signed_value = 0;
    EXPECT_EQ(decode_unsigned_int(data, sizeof(data), unsigned_value),
              EBML_PAYLOAD_INVALID_INTEGER_SIZE);
    EXPECT_EQ(decode_signed_int(data, sizeof(data), signed_value),
              EBML_PAYLOAD_INVALID_INTEGER_SIZE);
}

// ─── Floats ─────────────────────────────────────────────────────────────────

TEST(EbmlPayloadTest, FloatSizes) {
    double value = 1.0;

    EXPECT_EQ(decode_float(nullptr, 0, value), EBML_PAYLOAD_OK);
    EXPECT_DOUBLE_EQ(value, 0.0);

    const uint8_t single[] = {0x3F, 0xC0, 0x00, 0x00};
    EXPECT_EQ(decode_float(single, sizeof(single), value), EBML_PAYLOAD_OK);
    EXPECT_DOUBLE_EQ(value, 1.5);

    const uint8_t dbl[] = {0xC0, 0x59, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(decode_float(dbl, sizeof(dbl), value), EBML_PAYLOAD_OK);
    EXPECT_DOUBLE_EQ(value, -100.0);
}

TEST(EbmlPayloadTest, FloatOddSizeRejected) {
    const uint8_t data[] = {0x01, 0x02, 0x03};
    double value = 0.0;
    EXPECT_EQ(decode_float(data, sizeof(data), value), EBML_PAYLOAD_INVALID_FLOAT_SIZE);
}

// ─── UTF-8 ──────────────────────────────────────────────────────────────────

TEST(EbmlPayloadTest, Utf8Valid) {
    const uint8_t text[] = {'h', 0xC3, 0xA9, 'l', 'l', 'o', ' ', 0xE2, 0x82, 0xAC,
                            ' ', 0xF0, 0x9F, 0x8E, 0xB5};
    std::string value;
    ASSERT_EQ(decode_utf8(text, sizeof(text), value), EBML_PAYLOAD_OK);
    EXPECT_EQ(value, std::string(reinterpret_cast<const char*>(text), sizeof(text)));

    value = "stale";
    EXPECT_EQ(decode_utf8(nullptr, 0, value), EBML_PAYLOAD_OK);
    EXPECT_TRUE(value.empty());
}

TEST(EbmlPayloadTest, Utf8Rejected) {
    std::string value = "untouched";

    const uint8_t bad_continuation[] = {0xC3, 0x28};
    EXPECT_EQ(decode_utf8(bad_continuation, sizeof(bad_continuation), value),
              EBML_PAYLOAD_INVALID_UTF8);

    const uint8_t overlong[] = {0xC0, 0x80};
    EXPECT_EQ(decode_utf8(overlong, sizeof(overlong), value), EBML_PAYLOAD_INVALID_UTF8);

    const uint8_t surrogate[] = {0xED, 0xA0, 0x80};
    EXPECT_EQ(decode_utf8(surrogate, sizeof(surrogate), value), EBML_PAYLOAD_INVALID_UTF8);

    const uint8_t too_large[] = {0xF4, 0x90, 0x80, 0x80};
    EXPECT_EQ(decode_utf8(too_large, sizeof(too_large), value), EBML_PAYLOAD_INVALID_UTF8);

    const uint8_t truncated[] = {'a', 0xE2, 0x82};
    EXPECT_EQ(decode_utf8(truncated, sizeof(truncated), value), EBML_PAYLOAD_INVALID_UTF8);

    const uint8_t stray[] = {0x80};
    EXPECT_EQ(decode_utf8(stray, sizeof(stray), value), EBML_PAYLOAD_INVALID_UTF8);

    EXPECT_EQ(value, "untouched");
}

// ─── Tag construction ───────────────────────────────────────────────────────

TEST(EbmlPayloadTest, BuildsTypedTags) {
    const EbmlSpecification& spec = test_specification();
    EbmlTagPtr tag;

    const uint8_t five[] = {0x05};
    ASSERT_EQ(decode_tag_payload(spec, ID_UINT, EBML_TYPE_UNSIGNED_INT, five, 1, tag),
              EBML_PAYLOAD_OK);
    ASSERT_EQ(tag->kind(), EBML_TAG_UNSIGNED_INT);
    EXPECT_EQ(static_cast<EbmlUnsignedIntTag&>(*tag).value(), 5u);
    EXPECT_STREQ(tag->name(), "UInt");

    const uint8_t text[] = {'a', 'b'};
    ASSERT_EQ(decode_tag_payload(spec, ID_TEXT, EBML_TYPE_UTF8, text, 2, tag), EBML_PAYLOAD_OK);
    ASSERT_EQ(tag->kind(), EBML_TAG_UTF8);
    EXPECT_EQ(static_cast<EbmlUtf8Tag&>(*tag).value(), "ab");
}

TEST(EbmlPayloadTest, BinaryFallsBackToRaw) {
    const uint8_t data[] = {0xDE, 0xAD};
    EbmlTagPtr tag;
    ASSERT_EQ(decode_tag_payload(test_specification(), ID_BINARY, EBML_TYPE_BINARY, data, 2, tag),
              EBML_PAYLOAD_OK);
    ASSERT_EQ(tag->kind(), EBML_TAG_RAW);
    EXPECT_EQ(static_cast<EbmlRawTag&>(*tag).data(), (Bytes{0xDE, 0xAD}));
}

TEST(EbmlPayloadTest, ErrorLeavesTagUnset) {
    const uint8_t data[] = {0x01, 0x02, 0x03};
    EbmlTagPtr tag;
    EXPECT_EQ(decode_tag_payload(test_specification(), ID_FLOAT, EBML_TYPE_FLOAT, data, 3, tag),
              EBML_PAYLOAD_INVALID_FLOAT_SIZE);
    EXPECT_FALSE(tag);
}

TEST(EbmlPayloadDeathTest, SpecificationThatCannotBuildAborts) {
    // ID_TEXT is declared UTF-8, so the table refuses to build an unsigned int for it
    const uint8_t one[] = {0x01};
    EbmlTagPtr tag;
    EXPECT_DEATH(decode_tag_payload(test_specification(), ID_TEXT, EBML_TYPE_UNSIGNED_INT, one, 1,
                                    tag),
                 "bad specification implementation");
}
