#include <gtest/gtest.h>
#include <glib.h>
#include "GLibTypes.h"
#include "HapError.h"

using namespace hapdb;

TEST(HapErrorTest, ConstructorWithNameAndMessage) {
    HapError error(HapError::ERROR_NOT_FOUND, "No service with iid 9");

    EXPECT_EQ(error.getName(), HapError::ERROR_NOT_FOUND);
    EXPECT_EQ(error.getMessage(), "No service with iid 9");
}

TEST(HapErrorTest, ConstructFromGError) {
    GErrorPtr gerror = makeGErrorPtr(
        g_error_new_literal(g_quark_from_string("hapdb-test"), 0, "No such file or directory"));

    MalformedRecordError error(gerror.get());

    EXPECT_EQ(error.getName(), HapError::ERROR_MALFORMED_RECORD);
    EXPECT_EQ(error.getMessage(), "No such file or directory");
}

TEST(HapErrorTest, ConstructFromNullGError) {
    MalformedRecordError error(static_cast<const GError*>(nullptr));

    EXPECT_EQ(error.getMessage(), "Null error pointer");
}

TEST(HapErrorTest, ToStringFormat) {
    UnknownTypeError error("Unknown service type: toaster");
    std::string expected = std::string(HapError::ERROR_UNKNOWN_TYPE) + ": Unknown service type: toaster";

    EXPECT_EQ(error.toString(), expected);
    EXPECT_EQ(std::string(error.what()), expected);
}

TEST(HapErrorTest, SubclassesCarryTheirNames) {
    EXPECT_TRUE(UnknownTypeError("x").isErrorType(HapError::ERROR_UNKNOWN_TYPE));
    EXPECT_TRUE(DuplicateCharacteristicError("x").isErrorType(HapError::ERROR_DUPLICATE_CHARACTERISTIC));
    EXPECT_TRUE(NotFoundError("x").isErrorType(HapError::ERROR_NOT_FOUND));
    EXPECT_TRUE(MalformedRecordError("x").isErrorType(HapError::ERROR_MALFORMED_RECORD));
    EXPECT_FALSE(NotFoundError("x").isErrorType(HapError::ERROR_MALFORMED_RECORD));
}

TEST(HapErrorTest, CaughtAsHapError) {
    try {
        throw DuplicateCharacteristicError("duplicate");
    } catch (const HapError& e) {
        EXPECT_EQ(e.getName(), HapError::ERROR_DUPLICATE_CHARACTERISTIC);
        return;
    }
    FAIL() << "DuplicateCharacteristicError was not caught as HapError";
}
