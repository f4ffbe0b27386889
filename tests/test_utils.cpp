#include "test_util.hpp"
#include "utils.hpp"

namespace rip {

using testing_util::TempDirTest;
using testing_util::write_file;

class UtilsTest : public TempDirTest {};

TEST(HumanizeTest, PicksUnitWithMoreThanTen) {
    EXPECT_EQ(humanize_bytes(0), "0 bytes");
    EXPECT_EQ(humanize_bytes(5000), "5000 bytes");
    EXPECT_EQ(humanize_bytes(11000), "11 KB");
    EXPECT_EQ(humanize_bytes(600ULL * 1000 * 1000), "600 MB");
}

TEST_F(UtilsTest, TreeSizeSumsRegularFiles) {
    write_file(root_ / "d/a", std::string(10, 'a'));
    write_file(root_ / "d/sub/b", std::string(5, 'b'));
    fs::create_symlink(root_ / "d/a", root_ / "d/link");

    EXPECT_EQ(tree_size(root_ / "d"), 15u);
    EXPECT_EQ(tree_size(root_ / "d/a"), 10u);
    EXPECT_EQ(tree_size(root_ / "missing"), 0u);
}

TEST_F(UtilsTest, EnsureDirCreatesNestedPath) {
    EXPECT_TRUE(ensure_dir_exists(root_ / "x/y/z"));
    EXPECT_TRUE(fs::is_directory(root_ / "x/y/z"));
    EXPECT_TRUE(ensure_dir_exists(root_ / "x/y/z"));
}

}  // namespace rip
