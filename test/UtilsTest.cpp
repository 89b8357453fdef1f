#include <gtest/gtest.h>
#include <glib.h>
#include <glib/gstdio.h>
#include <unistd.h>
#include "Utils.h"

using namespace hapdb;

TEST(UtilsTest, TrimFunctions) {
    std::string str = "  Hello World  ";
    Utils::trimInPlace(str);
    EXPECT_EQ(str, "Hello World");

    std::string begin = "  Test";
    Utils::trimBeginInPlace(begin);
    EXPECT_EQ(begin, "Test");

    std::string end = "Test  ";
    Utils::trimEndInPlace(end);
    EXPECT_EQ(end, "Test");

    EXPECT_EQ(Utils::trim("\t Hello \n"), "Hello");
}

TEST(UtilsTest, CaseConversion) {
    EXPECT_EQ(Utils::toUpper("0026bb765291"), "0026BB765291");
    EXPECT_EQ(Utils::toLower("Public.HAP"), "public.hap");
}

TEST(UtilsTest, IsHexString) {
    EXPECT_TRUE(Utils::isHexString("43"));
    EXPECT_TRUE(Utils::isHexString("0026bb765291"));
    EXPECT_FALSE(Utils::isHexString(""));
    EXPECT_FALSE(Utils::isHexString("lightbulb"));
    EXPECT_FALSE(Utils::isHexString("00-43"));
}

TEST(UtilsTest, ReadFile) {
    gchar* path = nullptr;
    GError* error = nullptr;
    gint fd = g_file_open_tmp("hapdb-utils-XXXXXX.json", &path, &error);
    ASSERT_NE(fd, -1);
    close(fd);

    ASSERT_TRUE(g_file_set_contents(path, "{\"accessories\": []}", -1, &error));

    std::string content;
    std::string message;
    EXPECT_TRUE(Utils::readFile(path, content, message));
    EXPECT_EQ(content, "{\"accessories\": []}");

    g_unlink(path);
    g_free(path);
}

TEST(UtilsTest, ReadMissingFile) {
    std::string content;
    std::string message;
    EXPECT_FALSE(Utils::readFile("/nonexistent/hapdb/accessories.json", content, message));
    EXPECT_FALSE(message.empty());
}
