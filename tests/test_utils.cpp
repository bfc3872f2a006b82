#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/wc_error.hpp>

TEST(Utils, TrimBothEnds) {
    EXPECT_EQ(trimmed("  home:user \n"), "home:user");
    EXPECT_EQ(trimmed("\t\r\n"), "");
    EXPECT_EQ(trimmed(""), "");
    EXPECT_EQ(trimmed("a b"), "a b");
}

TEST(Utils, ReadFileMissingThrows) {
    EXPECT_THROW(read_file("/nonexistent/wcstore/file"), std::filesystem::filesystem_error);
}

TEST(WCErrorTest, CarriesKindPathAndEntries) {
    WCError e(WCErrorKind::Inconsistent, "broken", "/tmp/wc", {"_apiurl"});
    EXPECT_EQ(e.kind(), WCErrorKind::Inconsistent);
    EXPECT_EQ(e.path(), std::filesystem::path("/tmp/wc"));
    EXPECT_EQ(e.entries().size(), 1u);
    EXPECT_STREQ(e.what(), "broken");
    EXPECT_STREQ(wc_error_kind_name(WCErrorKind::DoubleLock), "double-lock");
}
