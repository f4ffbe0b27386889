#include "core/errors.hpp"
#include "core/paths.hpp"
#include "test_util.hpp"

namespace rip {

using testing_util::TempDirTest;
using testing_util::write_file;

class PathsTest : public TempDirTest {};

TEST(GravePathTest, AbsoluteOriginalIsConcatenated) {
    EXPECT_EQ(grave_path_for("/tmp/gy", "/home/u/notes.txt"), fs::path("/tmp/gy/home/u/notes.txt"));
    EXPECT_EQ(grave_path_for("/tmp/gy", "rel/a"), fs::path("/tmp/gy/rel/a"));
}

TEST(IsUnderTest, ComparesWholeComponents) {
    EXPECT_TRUE(is_under("/tmp/gy/a/b", "/tmp/gy"));
    EXPECT_TRUE(is_under("/tmp/gy", "/tmp/gy/"));
    EXPECT_FALSE(is_under("/tmp/gy2/a", "/tmp/gy"));
    EXPECT_FALSE(is_under("/tmp", "/tmp/gy"));
}

TEST(NormalizePathTest, DropsTrailingSlashAndDotSegments) {
    EXPECT_EQ(normalize_path("/gy/home/u/proj/"), fs::path("/gy/home/u/proj"));
    EXPECT_EQ(normalize_path("/gy/home/u/./n.txt"), fs::path("/gy/home/u/n.txt"));
    EXPECT_EQ(normalize_path("/gy/a/../b"), fs::path("/gy/b"));
    EXPECT_EQ(normalize_path("/"), fs::path("/"));
}

TEST_F(PathsTest, EntryExistsSeesDanglingSymlink) {
    fs::create_symlink(root_ / "nowhere", root_ / "dangling");
    EXPECT_TRUE(entry_exists(root_ / "dangling"));
    EXPECT_FALSE(entry_exists(root_ / "nowhere"));
}

TEST_F(PathsTest, ConflictPicksFirstFreeSuffix) {
    fs::path candidate = root_ / "a.txt";
    EXPECT_EQ(resolve_conflict(candidate), candidate);

    write_file(candidate, "1");
    EXPECT_EQ(resolve_conflict(candidate), fs::path(candidate.string() + "~1"));

    write_file(candidate.string() + "~1", "2");
    EXPECT_EQ(resolve_conflict(candidate), fs::path(candidate.string() + "~2"));
}

TEST_F(PathsTest, BlockingAncestorIsFound) {
    write_file(root_ / "gy/home/u/a", "file, not a directory");
    auto ancestor = find_blocking_ancestor(root_ / "gy/home/u/a/b");
    ASSERT_TRUE(ancestor.has_value());
    EXPECT_EQ(*ancestor, root_ / "gy/home/u/a");

    EXPECT_FALSE(find_blocking_ancestor(root_ / "gy/home/u/c/d").has_value());
}

TEST_F(PathsTest, GraveDestinationRenamesTakenGrave) {
    write_file(root_ / "gy/x", "old");
    EXPECT_EQ(resolve_grave_destination(root_ / "gy/x"), root_ / "gy/x~1");
    EXPECT_EQ(resolve_grave_destination(root_ / "gy/y"), root_ / "gy/y");
}

TEST_F(PathsTest, GraveDestinationReRootsUnderRenamedAncestor) {
    write_file(root_ / "gy/home/u/a", "file");
    EXPECT_EQ(resolve_grave_destination(root_ / "gy/home/u/a/b"), root_ / "gy/home/u/a~1/b");
}

TEST_F(PathsTest, PruneStopsAtGraveyardAndNonEmptyDirs) {
    write_file(root_ / "gy/keep/file", "x");
    fs::create_directories(root_ / "gy/keep/a/b/c");

    prune_empty_parents(root_ / "gy/keep/a/b/c/grave", root_ / "gy");
    EXPECT_FALSE(fs::exists(root_ / "gy/keep/a"));
    EXPECT_TRUE(fs::exists(root_ / "gy/keep/file"));

    fs::create_directories(root_ / "gy/empty");
    prune_empty_parents(root_ / "gy/empty/grave", root_ / "gy");
    EXPECT_FALSE(fs::exists(root_ / "gy/empty"));
    EXPECT_TRUE(fs::is_directory(root_ / "gy"));
}

}  // namespace rip
