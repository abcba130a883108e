/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_table.h"
#include "arsc_test_builder.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace r2n::arsc;
using namespace r2n::arsc::test_support;

TEST(ArscTableTest, ParsesPackageHeaderAndPools) {
    const ResTable table = app_table();
    EXPECT_EQ(table.header.package_count, 1u);
    EXPECT_EQ(table.value_strings.size(), 1u);
    ASSERT_EQ(table.packages.size(), 1u);

    const Package& pkg = table.packages[0];
    EXPECT_EQ(pkg.header.id, 0x7fu);
    EXPECT_EQ(pkg.header.chunk.header_size, kPackageHeaderSize);
    EXPECT_EQ(pkg.header.name[0], 'a');
    EXPECT_EQ(pkg.header.name[2], 'p');
    EXPECT_EQ(pkg.type_strings.size(), 2u);
    EXPECT_EQ(pkg.key_strings.size(), 3u);
    EXPECT_EQ(pkg.type_strings.decode(1).text, "drawable");
    EXPECT_EQ(pkg.key_strings.decode(2).text, "icon");
}

TEST(ArscTableTest, GroupsTypeRecordsUnderTheirSpec) {
    PackageDef def = app_package();
    def.types = {{1, 2, 3}, {2, 1, 2}};
    const Package pkg = parse_package(package_chunk(def));

    ASSERT_EQ(pkg.types.size(), 2u);
    ASSERT_EQ(pkg.types[0].size(), 4u);
    EXPECT_TRUE(pkg.types[0][0].is_spec());
    EXPECT_FALSE(pkg.types[0][1].is_spec());
    EXPECT_EQ(pkg.types[0][0].header.id, 1);
    EXPECT_EQ(pkg.types[0][0].header.entry_count, 2u);
    EXPECT_EQ(pkg.types[0][3].header.entries_start, 84u + 4u * 2u);
    ASSERT_EQ(pkg.types[1].size(), 3u);
    EXPECT_EQ(pkg.types[1][0].header.id, 2);
    EXPECT_EQ(pkg.types[1][0].header.entry_count, 1u);
}

TEST(ArscTableTest, ParsesMultiplePackages) {
    PackageDef framework{};
    framework.id = 0x01;
    framework.name = "android";
    framework.type_names = {"attr"};
    framework.keys = {"theme"};
    framework.types = {{1, 1, 1}};

    const ResTable table = parse_arsc(
        table_chunk({package_chunk(framework), package_chunk(app_package(false))})
    );
    ASSERT_EQ(table.packages.size(), 2u);
    EXPECT_EQ(table.packages[0].header.id, 0x01u);
    EXPECT_EQ(table.packages[1].header.id, 0x7fu);
    EXPECT_EQ(table.packages[1].key_strings.encoding(), StringEncoding::Utf16);
}

TEST(ArscTableTest, SkipsUnknownChunks) {
    const auto def = app_package();
    const Bytes pkg_bytes = package_chunk_from(
        def.id, def.name, string_pool_chunk(def.type_names, true),
        string_pool_chunk(def.keys, true),
        {library_chunk(), type_spec_chunk(1, 2), type_chunk(1, 2), library_chunk(),
         type_spec_chunk(2, 1)}
    );
    const Package pkg = parse_package(pkg_bytes);
    ASSERT_EQ(pkg.types.size(), 2u);
    EXPECT_EQ(pkg.types[0].size(), 2u);
    EXPECT_EQ(pkg.types[1].size(), 1u);
}

TEST(ArscTableTest, TypeChunkNeedsPrecedingSpec) {
    const auto def = app_package();
    const Bytes pkg_bytes = package_chunk_from(
        def.id, def.name, string_pool_chunk(def.type_names, true),
        string_pool_chunk(def.keys, true), {type_chunk(1, 2), type_spec_chunk(1, 2)}
    );
    EXPECT_THROW(parse_package(pkg_bytes), std::runtime_error);
}

TEST(ArscTableTest, PackageNeedsBothPools) {
    Bytes pkg_bytes = package_chunk_from(
        0x7f, "app", string_pool_chunk({"string"}, true), Bytes{}, {type_spec_chunk(1, 0)}
    );
    EXPECT_THROW(parse_package(pkg_bytes), std::runtime_error);
}

TEST(ArscTableTest, RejectsNonTableInput) {
    const Bytes pool = string_pool_chunk({"x"}, true);
    EXPECT_THROW(parse_arsc(pool), std::runtime_error);
    EXPECT_THROW(parse_arsc(Bytes{0x02, 0x00, 0x0C}), std::runtime_error);
}

TEST(ArscTableTest, RejectsTruncatedTable) {
    Bytes bytes = table_chunk({package_chunk(app_package())});
    bytes.resize(bytes.size() - 16);
    EXPECT_THROW(parse_arsc(bytes), std::runtime_error);
}

TEST(ArscTableTest, ToleratesPackageCountMismatch) {
    const ResTable table = parse_arsc(table_chunk({package_chunk(app_package())}, {}, 3));
    EXPECT_EQ(table.header.package_count, 3u);
    EXPECT_EQ(table.packages.size(), 1u);
}

TEST(ArscTableTest, AcceptsPreTypeIdOffsetHeaders) {
    // Older tables end the package header before typeIdOffset.
    const auto def = app_package();
    Bytes pkg = package_chunk(def);
    pkg.erase(pkg.begin() + 284, pkg.begin() + 288);
    pkg[2] = 284 & 0xFF;
    pkg[3] = (284 >> 8) & 0xFF;
    set_u32(pkg, 4, static_cast<std::uint32_t>(pkg.size()));
    set_u32(pkg, 268, 284);
    const auto type_pool_size = string_pool_chunk(def.type_names, true).size();
    set_u32(pkg, 276, 284 + static_cast<std::uint32_t>(type_pool_size));

    const Package parsed = parse_package(pkg);
    EXPECT_EQ(parsed.header.chunk.header_size, 284u);
    EXPECT_EQ(parsed.header.type_id_offset, 0u);
    EXPECT_EQ(parsed.key_strings.decode(0).text, "app_name");
}
