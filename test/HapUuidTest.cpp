#include <gtest/gtest.h>
#include <stdexcept>
#include "HapUuid.h"

using namespace hapdb;

TEST(HapUuidTest, ValidUUID) {
    EXPECT_NO_THROW(HapUuid("00000043-0000-1000-8000-0026BB765291"));
    EXPECT_NO_THROW(HapUuid("000000430000100080000026bb765291"));
    EXPECT_NO_THROW(HapUuid("43"));
}

TEST(HapUuidTest, InvalidUUID) {
    EXPECT_THROW(HapUuid("invalid-uuid-format"), std::invalid_argument);
    EXPECT_THROW(HapUuid("123456789"), std::invalid_argument);
    EXPECT_THROW(HapUuid(""), std::invalid_argument);
}

TEST(HapUuidTest, CanonicalFormIsUpperCaseAndDashed) {
    HapUuid uuid("000000430000100080000026bb765291");
    EXPECT_EQ(uuid.toString(), "00000043-0000-1000-8000-0026BB765291");
}

TEST(HapUuidTest, ShortFormExpandsOntoHapBase) {
    EXPECT_EQ(HapUuid("43").toString(), "00000043-0000-1000-8000-0026BB765291");
    EXPECT_EQ(HapUuid("3e").toString(), "0000003E-0000-1000-8000-0026BB765291");
    EXPECT_EQ(HapUuid::fromShortUuid(0x135).toString(), "00000135-0000-1000-8000-0026BB765291");
    EXPECT_EQ(HapUuid("43"), HapUuid("00000043-0000-1000-8000-0026BB765291"));
}

TEST(HapUuidTest, ToShortString) {
    EXPECT_EQ(HapUuid::fromShortUuid(0x25).toShortString(), "25");
    EXPECT_EQ(HapUuid::fromShortUuid(0x135).toShortString(), "135");

    HapUuid custom("12345678-1234-5678-1234-567812345678");
    EXPECT_FALSE(custom.isHapBase());
    EXPECT_EQ(custom.toShortString(), "12345678-1234-5678-1234-567812345678");
}

TEST(HapUuidTest, LooksLikeUuid) {
    EXPECT_TRUE(HapUuid::looksLikeUuid("43"));
    EXPECT_TRUE(HapUuid::looksLikeUuid("00000043-0000-1000-8000-0026BB765291"));
    EXPECT_FALSE(HapUuid::looksLikeUuid("lightbulb"));
    EXPECT_FALSE(HapUuid::looksLikeUuid("public.hap.service.lightbulb"));
}

TEST(HapUuidTest, Ordering) {
    EXPECT_LT(HapUuid("25"), HapUuid("43"));
    EXPECT_NE(HapUuid("25"), HapUuid("43"));
}
