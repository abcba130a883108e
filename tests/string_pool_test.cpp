/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_string_pool.h"
#include "arsc_test_builder.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace r2n::arsc;
using namespace r2n::arsc::test_support;

TEST(StringPoolTest, ParsesUtf8Pool) {
    const auto pool = parse_string_pool(string_pool_chunk({"app_name", "hello", "icon"}, true));
    EXPECT_EQ(pool.header.string_count, 3u);
    EXPECT_EQ(pool.encoding(), StringEncoding::Utf8);
    ASSERT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool.strings[1], pool_entry("hello", true));
    EXPECT_EQ(pool.decode(0).text, "app_name");
    EXPECT_EQ(pool.decode(2).text, "icon");
}

TEST(StringPoolTest, ParsesUtf16Pool) {
    const auto pool = parse_string_pool(string_pool_chunk({"string", "drawable"}, false));
    EXPECT_EQ(pool.encoding(), StringEncoding::Utf16);
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.strings[0], pool_entry("string", false));
    EXPECT_EQ(pool.decode(1).text, "drawable");
}

TEST(StringPoolTest, EmptyPool) {
    const auto pool = parse_string_pool(string_pool_chunk({}, true));
    EXPECT_EQ(pool.size(), 0u);
}

TEST(StringPoolTest, IndexPastEndIsReported) {
    const auto pool = parse_string_pool(string_pool_chunk({"only"}, true));
    const auto d = pool.decode(1);
    ASSERT_FALSE(d.ok());
    EXPECT_EQ(d.error->kind, ResolveErrorKind::KeyIndexOutOfRange);
}

TEST(StringPoolTest, OverrunningEntryFailsOnlyWhenDecoded) {
    auto chunk = string_pool_chunk({"ok", "ab"}, true);
    // Entry #1 starts 5 bytes into the string data ({2, 2, 'o', 'k', 0}); inflate its byte length.
    const std::size_t strings_start = read_u32_le(chunk, 20);
    chunk[strings_start + 5 + 1] = 40;

    const auto pool = parse_string_pool(chunk);
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.decode(0).text, "ok");
    const auto bad = pool.decode(1);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error->kind, ResolveErrorKind::StringDecodeError);
}

TEST(StringPoolTest, RejectsWrongChunkType) {
    auto chunk = string_pool_chunk({"x"}, true);
    chunk[0] = 0x02;
    EXPECT_THROW(parse_string_pool(chunk), std::runtime_error);
}

TEST(StringPoolTest, RejectsOffsetOutsideStringData) {
    auto chunk = string_pool_chunk({"x"}, true);
    set_u32(chunk, kStringPoolHeaderSize, 0x1000);
    EXPECT_THROW(parse_string_pool(chunk), std::runtime_error);
}

TEST(StringPoolTest, RejectsCountLargerThanOffsetTable) {
    auto chunk = string_pool_chunk({"x"}, true);
    set_u32(chunk, 8, 1000);
    EXPECT_THROW(parse_string_pool(chunk), std::runtime_error);
}

TEST(StringPoolTest, RejectsTruncatedChunk) {
    auto chunk = string_pool_chunk({"abc", "def"}, true);
    chunk.resize(chunk.size() - 4);
    EXPECT_THROW(parse_string_pool(chunk), std::runtime_error);
}
