/**
 * Copyright (c) 2026 rid2name authors
 */
#include "arsc/arsc_hex.h"
#include "arsc/arsc_res_id.h"

#include <gtest/gtest.h>

using r2n::arsc::compose;
using r2n::arsc::decompose;
using r2n::arsc::ResId;
using r2n::arsc::to_hex;

TEST(ResIdTest, SplitsPackageTypeAndEntry) {
    const ResId rid = decompose(0x7f020001u);
    EXPECT_EQ(rid.package_id, 0x7f);
    EXPECT_EQ(rid.type_id, 0x02);
    EXPECT_EQ(rid.entry_id, 0x0001);
}

TEST(ResIdTest, UsesFullWidthOfEachField) {
    const ResId rid = decompose(0xFFFEABCDu);
    EXPECT_EQ(rid.package_id, 0xFF);
    EXPECT_EQ(rid.type_id, 0xFE);
    EXPECT_EQ(rid.entry_id, 0xABCD);
}

TEST(ResIdTest, DoesNotValidateReservedComponents) {
    const ResId rid = decompose(0x00000000u);
    EXPECT_EQ(rid.package_id, 0);
    EXPECT_EQ(rid.type_id, 0);
    EXPECT_EQ(rid.entry_id, 0);
}

TEST(ResIdTest, ComposeInvertsDecompose) {
    for (const std::uint32_t id :
         {0x7f010000u, 0x7f010001u, 0x01040013u, 0x80ff7fffu, 0xFFFFFFFFu}) {
        EXPECT_EQ(compose(decompose(id)), id);
    }
    EXPECT_EQ(decompose(compose(ResId{0x02, 0x10, 0x0203})), (ResId{0x02, 0x10, 0x0203}));
}

TEST(HexTest, PadsAndTruncatesToDigitCount) {
    EXPECT_EQ(to_hex(0x7f, 2), "0x7f");
    EXPECT_EQ(to_hex(0x2, 2), "0x02");
    EXPECT_EQ(to_hex(0x7f010000u, 8), "0x7f010000");
    EXPECT_EQ(to_hex(0x1ABu, 2), "0xab");
}
