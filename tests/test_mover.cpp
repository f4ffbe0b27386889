#include "core/errors.hpp"
#include "core/mover.hpp"
#include "test_util.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace rip {

using testing_util::read_file;
using testing_util::TempDirTest;
using testing_util::write_file;

class MoverTest : public TempDirTest {
protected:
    ConfirmFn answer(bool yes) {
        return [this, yes](const std::string &message) {
            prompts_.push_back(message);
            return yes;
        };
    }

    std::vector<std::string> prompts_;
};

TEST_F(MoverTest, RelocateRenamesAndCreatesParents) {
    write_file(root_ / "src/a.txt", "hello");
    relocate(root_ / "src/a.txt", root_ / "gy/deep/dir/a.txt", answer(false));

    EXPECT_FALSE(fs::exists(root_ / "src/a.txt"));
    EXPECT_EQ(read_file(root_ / "gy/deep/dir/a.txt"), "hello");
    EXPECT_TRUE(prompts_.empty());
}

TEST_F(MoverTest, RelocateMissingSourceFails) {
    try {
        relocate(root_ / "absent", root_ / "gy/absent", answer(false));
        FAIL() << "expected RipError";
    } catch (const RipError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoFailure);
        EXPECT_EQ(e.phase(), "rename");
    }
}

TEST_F(MoverTest, CopyTreePreservesContentLinksAndModes) {
    write_file(root_ / "src/d/one.txt", "1");
    write_file(root_ / "src/d/sub/two.txt", "22");
    fs::create_symlink("one.txt", root_ / "src/d/link");
    ASSERT_EQ(mkfifo((root_ / "src/d/pipe").c_str(), 0640), 0);
    fs::permissions(root_ / "src/d/one.txt", fs::perms::owner_read | fs::perms::owner_write);
    fs::permissions(root_ / "src/d/sub", fs::perms::owner_all);

    copy_then_remove(root_ / "src/d", root_ / "gy/d", answer(false));

    EXPECT_FALSE(fs::exists(root_ / "src/d"));
    EXPECT_EQ(read_file(root_ / "gy/d/one.txt"), "1");
    EXPECT_EQ(read_file(root_ / "gy/d/sub/two.txt"), "22");
    EXPECT_TRUE(fs::is_symlink(root_ / "gy/d/link"));
    EXPECT_EQ(fs::read_symlink(root_ / "gy/d/link"), fs::path("one.txt"));
    EXPECT_TRUE(fs::is_fifo(fs::symlink_status(root_ / "gy/d/pipe")));
    EXPECT_EQ(fs::status(root_ / "gy/d/one.txt").permissions(),
              fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(fs::status(root_ / "gy/d/sub").permissions(), fs::perms::owner_all);
    EXPECT_TRUE(prompts_.empty());
}

TEST_F(MoverTest, CopySingleSymlinkKeepsLink) {
    fs::create_directories(root_ / "src");
    fs::create_symlink(root_ / "nowhere", root_ / "src/dangling");

    copy_then_remove(root_ / "src/dangling", root_ / "gy/dangling", answer(false));

    EXPECT_FALSE(fs::exists(fs::symlink_status(root_ / "src/dangling")));
    EXPECT_EQ(fs::read_symlink(root_ / "gy/dangling"), root_ / "nowhere");
}

TEST_F(MoverTest, BigFileDeletedWhenConfirmed) {
    write_file(root_ / "src/big.bin", std::string(64, 'x'));
    MoveOptions options;
    options.big_file_threshold = 16;

    copy_then_remove(root_ / "src/big.bin", root_ / "gy/big.bin", answer(true), options);

    ASSERT_EQ(prompts_.size(), 1u);
    EXPECT_NE(prompts_[0].find("About to copy a big file"), std::string::npos);
    EXPECT_FALSE(fs::exists(root_ / "src/big.bin"));
    EXPECT_FALSE(fs::exists(root_ / "gy/big.bin"));
}

TEST_F(MoverTest, BigFileCopiedWhenDeclined) {
    write_file(root_ / "src/big.bin", std::string(64, 'x'));
    MoveOptions options;
    options.big_file_threshold = 16;

    copy_then_remove(root_ / "src/big.bin", root_ / "gy/big.bin", answer(false), options);

    EXPECT_EQ(prompts_.size(), 1u);
    EXPECT_EQ(fs::file_size(root_ / "gy/big.bin"), 64u);
}

class SpecialFileTest : public MoverTest {
protected:
    void SetUp() override {
        MoverTest::SetUp();
        fs::create_directories(root_ / "src");
        socket_path_ = root_ / "src/sock";
        fd_ = testing_util::bind_unix_socket(socket_path_);
        ASSERT_GE(fd_, 0);
    }

    void TearDown() override {
        if (fd_ >= 0) {
            close(fd_);
        }
        MoverTest::TearDown();
    }

    fs::path socket_path_;
    int fd_ = -1;
};

TEST_F(SpecialFileTest, DeclinedSocketIsLeftInPlace) {
    try {
        copy_then_remove(socket_path_, root_ / "gy/sock", answer(false));
        FAIL() << "expected SpecialFileDeclined";
    } catch (const RipError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpecialFileDeclined);
    }
    EXPECT_TRUE(fs::is_socket(fs::symlink_status(socket_path_)));
}

TEST_F(SpecialFileTest, AcceptedSocketLeavesMarker) {
    copy_then_remove(socket_path_, root_ / "gy/sock", answer(true));

    EXPECT_FALSE(fs::exists(fs::symlink_status(socket_path_)));
    EXPECT_EQ(read_file(root_ / "gy/sock"), SPECIAL_FILE_MARKER);
}

}  // namespace rip
