#include "store/enum_store.hpp"
#include "registry/errors.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>

class EnumStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    idreg::EnumStore store{dir.file("indices.enum")};
};

TEST_F(EnumStoreTest, LineNumberIsId) {
    dir.write("indices.enum", "alpha\nbeta\ngamma\n");

    auto names = store.load();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "beta");
    EXPECT_EQ(names[2], "gamma");
}

TEST_F(EnumStoreTest, AcceptsMissingTrailingNewline) {
    dir.write("indices.enum", "alpha\nbeta");

    auto names = store.load();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[1], "beta");
}

TEST_F(EnumStoreTest, MissingFileIsCreatedEmpty) {
    EXPECT_TRUE(store.load().empty());
    EXPECT_TRUE(std::filesystem::exists(store.path()));
    EXPECT_EQ(dir.read("indices.enum"), "");
}

TEST_F(EnumStoreTest, MissingDirectoryIsCreated) {
    idreg::EnumStore nested(dir.path() / "caches" / "index" / "indices.enum");

    EXPECT_TRUE(nested.load().empty());
    EXPECT_TRUE(std::filesystem::exists(nested.path()));
}

TEST_F(EnumStoreTest, GarbageBytesResetTheStore) {
    dir.write("indices.enum", std::string("alpha\n\xFF\xFE\x00\x01junk\n", 15));

    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(dir.read("indices.enum"), "");
}

TEST_F(EnumStoreTest, TrailingBlankLinesAreIgnored) {
    dir.write("indices.enum", "alpha\nbeta\ngamma\n\n\n");

    auto names = store.load();
    EXPECT_EQ(names, (std::vector<std::string>{"alpha", "beta", "gamma"}));
    // The file is left as it was
    EXPECT_EQ(dir.read("indices.enum"), "alpha\nbeta\ngamma\n\n\n");
}

TEST_F(EnumStoreTest, InteriorBlankLineKeepsItsId) {
    dir.write("indices.enum", "alpha\n\nbeta\n");

    auto names = store.load();
    EXPECT_EQ(names, (std::vector<std::string>{"alpha", "", "beta"}));
}

TEST_F(EnumStoreTest, DuplicateNameKeepsFirstId) {
    dir.write("indices.enum", "alpha\nbeta\nalpha\n");

    auto names = store.load();
    EXPECT_EQ(names, (std::vector<std::string>{"alpha", "beta", ""}));
}

TEST_F(EnumStoreTest, AcceptsCrlfLineEndings) {
    dir.write("indices.enum", "alpha\r\nbeta\r\n");

    auto names = store.load();
    EXPECT_EQ(names, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(EnumStoreTest, ShortReadResetsTheStore) {
    // procfs reports a size of zero but yields contents
    std::filesystem::path status("/proc/self/status");
    if (!std::filesystem::exists(status)) {
        GTEST_SKIP() << "no procfs";
    }

    idreg::EnumStore proc_store(status);
    EXPECT_TRUE(proc_store.load().empty());
}

TEST_F(EnumStoreTest, RewriteReplacesWholeFile) {
    store.rewrite({"alpha", "beta", "gamma"});
    EXPECT_EQ(dir.read("indices.enum"), "alpha\nbeta\ngamma\n");

    store.rewrite({"alpha"});
    EXPECT_EQ(dir.read("indices.enum"), "alpha\n");

    // No temporary left behind
    EXPECT_FALSE(std::filesystem::exists(dir.file("indices.enum.tmp")));
}

TEST_F(EnumStoreTest, RewriteThenLoadKeepsOrder) {
    std::vector<std::string> names = {"z", "y", "\xC3\xA9t\xC3\xA9", "x"};
    store.rewrite(names);

    idreg::EnumStore reopened(dir.file("indices.enum"));
    EXPECT_EQ(reopened.load(), names);
}

TEST_F(EnumStoreTest, RewriteFailureThrows) {
    // A regular file where the parent directory should be
    dir.write("blocker", "not a directory");
    idreg::EnumStore blocked(dir.file("blocker") / "indices.enum");

    EXPECT_THROW(blocked.rewrite({"alpha"}), idreg::PersistenceFailure);
}

TEST_F(EnumStoreTest, LoadSurvivesUnwritableLocation) {
    dir.write("blocker", "not a directory");
    idreg::EnumStore blocked(dir.file("blocker") / "indices.enum");

    EXPECT_NO_THROW({
        auto names = blocked.load();
        EXPECT_TRUE(names.empty());
    });
}
