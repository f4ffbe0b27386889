#include "conf/config.hpp"
#include "test_util.hpp"
#include <cstdlib>
#include <utility>
#include <vector>

namespace rip {

using testing_util::TempDirTest;
using testing_util::write_file;

class ConfigTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        save_env("GRAVEYARD");
        save_env("XDG_DATA_HOME");
        save_env("XDG_CONFIG_HOME");
        save_env("USER");
        unsetenv("GRAVEYARD");
        unsetenv("XDG_DATA_HOME");
        unsetenv("XDG_CONFIG_HOME");
    }

    void TearDown() override {
        for (const auto &saved : saved_env_) {
            if (saved.second.first) {
                setenv(saved.first.c_str(), saved.second.second.c_str(), 1);
            } else {
                unsetenv(saved.first.c_str());
            }
        }
        TempDirTest::TearDown();
    }

    void save_env(const std::string &name) {
        const char *value = std::getenv(name.c_str());
        saved_env_.emplace_back(name, std::make_pair(value != nullptr, value ? value : ""));
    }

    std::vector<std::pair<std::string, std::pair<bool, std::string>>> saved_env_;
};

TEST_F(ConfigTest, FromFileReadsKnownKeys) {
    write_file(root_ / "config.toml",
               "# comment\n"
               "graveyard = \"/srv/graves\"\n"
               "max_depth = 4\n"
               "verbose = true\n"
               "\n"
               "unknown = 1\n"
               "log_file = \"/var/log/rip.log\"\n");

    Config config = Config::from_file(root_ / "config.toml");
    EXPECT_EQ(config.graveyard, fs::path("/srv/graves"));
    EXPECT_EQ(config.max_depth, 4u);
    EXPECT_TRUE(config.verbose);
    EXPECT_FALSE(config.inspect);
    EXPECT_EQ(config.log_file, fs::path("/var/log/rip.log"));
}

TEST_F(ConfigTest, FromFileRejectsBadDepthAndMissingFile) {
    write_file(root_ / "bad.toml", "max_depth = deep\n");
    EXPECT_THROW(Config::from_file(root_ / "bad.toml"), std::runtime_error);
    EXPECT_THROW(Config::from_file(root_ / "absent.toml"), std::runtime_error);
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config config;
    config.graveyard = "/srv/graves";
    config.max_depth = 7;
    config.inspect = true;
    ASSERT_TRUE(config.save_to_file(root_ / "nested/config.toml"));

    Config loaded = Config::from_file(root_ / "nested/config.toml");
    EXPECT_EQ(loaded.graveyard, config.graveyard);
    EXPECT_EQ(loaded.max_depth, 7u);
    EXPECT_TRUE(loaded.inspect);
    EXPECT_FALSE(loaded.verbose);
}

TEST_F(ConfigTest, CliOverridesOnlyWhatItSets) {
    Config config;
    config.max_depth = 4;
    config.merge_with_cli(0, false, false);
    EXPECT_EQ(config.max_depth, 4u);
    EXPECT_FALSE(config.verbose);

    config.merge_with_cli(2, true, true);
    EXPECT_EQ(config.max_depth, 2u);
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.inspect);
}

TEST_F(ConfigTest, GraveyardResolutionOrder) {
    Config config;
    setenv("USER", "alice", 1);
    EXPECT_EQ(config.resolve_graveyard(""), fs::path("/tmp/graveyard-alice"));

    setenv("XDG_DATA_HOME", "/home/alice/.local/share", 1);
    EXPECT_EQ(config.resolve_graveyard(""), fs::path("/home/alice/.local/share/graveyard"));

    config.graveyard = "/srv/from-config";
    EXPECT_EQ(config.resolve_graveyard(""), fs::path("/srv/from-config"));

    setenv("GRAVEYARD", "/srv/from-env", 1);
    EXPECT_EQ(config.resolve_graveyard(""), fs::path("/srv/from-env"));

    EXPECT_EQ(config.resolve_graveyard("/srv/from-cli"), fs::path("/srv/from-cli"));
}

TEST_F(ConfigTest, UnknownUserFallback) {
    unsetenv("USER");
    EXPECT_EQ(current_user(), "unknown");
    EXPECT_EQ(Config().resolve_graveyard(""), fs::path("/tmp/graveyard-unknown"));
}

TEST_F(ConfigTest, DefaultPathFollowsXdgConfigHome) {
    setenv("XDG_CONFIG_HOME", root_.c_str(), 1);
    EXPECT_EQ(default_config_path(), root_ / "rip/config.toml");

    write_file(root_ / "rip/config.toml", "max_depth = 3\n");
    EXPECT_EQ(Config::load_default().max_depth, 3u);
}

}  // namespace rip
