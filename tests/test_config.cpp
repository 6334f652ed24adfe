#include <gtest/gtest.h>
#include "config.hpp"
#include "exception.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_root;
    std::string saved_xdg;
    bool had_xdg = false;

    void SetUp() override {
        test_root = fs::absolute(std::string("tmp_config_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_root);
        fs::create_directories(test_root);

        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        had_xdg = xdg != nullptr;
        if (xdg) saved_xdg = xdg;
        setenv("XDG_CONFIG_HOME", test_root.c_str(), 1);
    }

    void TearDown() override {
        if (had_xdg) {
            setenv("XDG_CONFIG_HOME", saved_xdg.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
        fs::remove_all(test_root);
    }

    fs::path write_config(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, Defaults) {
    Settings settings;
    EXPECT_EQ(settings.update_url, "https://clients2.google.com/service/update2/crx");
    EXPECT_EQ(settings.chrome_version, "114.0.5735.133");
    EXPECT_EQ(settings.output_dir, fs::path("extensions"));
    EXPECT_EQ(settings.max_redirects, 5);
    EXPECT_EQ(settings.connect_timeout, 0);
    EXPECT_EQ(settings.timeout, 0);
}

TEST_F(ConfigTest, DefaultPathFollowsXdg) {
    EXPECT_EQ(default_config_path(), test_root / "crxget" / "crxget.conf");
}

TEST_F(ConfigTest, MissingDefaultFileUsesDefaults) {
    Settings settings = load_settings();
    EXPECT_EQ(settings.chrome_version, DEFAULT_CHROME_VERSION);
}

TEST_F(ConfigTest, DefaultFileIsApplied) {
    write_config(test_root / "crxget" / "crxget.conf",
                 "# comment\n"
                 "\n"
                 "chrome_version = 120.0.6099.71\n"
                 "output_dir=/tmp/crx-out\r\n"
                 "max_redirects=3\n"
                 "connect_timeout=10\n"
                 "timeout=60\n"
                 "update_url=http://127.0.0.1:8080/crx\n");
    Settings settings = load_settings();
    EXPECT_EQ(settings.chrome_version, "120.0.6099.71");
    EXPECT_EQ(settings.output_dir, fs::path("/tmp/crx-out"));
    EXPECT_EQ(settings.max_redirects, 3);
    EXPECT_EQ(settings.connect_timeout, 10);
    EXPECT_EQ(settings.timeout, 60);
    EXPECT_EQ(settings.update_url, "http://127.0.0.1:8080/crx");
}

TEST_F(ConfigTest, ExplicitFileMustExist) {
    EXPECT_THROW(load_settings(test_root / "nope.conf"), CrxgetException);
}

TEST_F(ConfigTest, ExplicitFileOverridesDefaultLocation) {
    write_config(test_root / "crxget" / "crxget.conf", "chrome_version=1.0\n");
    fs::path custom = write_config(test_root / "custom.conf", "max_redirects=0\n");
    Settings settings = load_settings(custom);
    EXPECT_EQ(settings.chrome_version, DEFAULT_CHROME_VERSION);
    EXPECT_EQ(settings.max_redirects, 0);
}

TEST_F(ConfigTest, InvalidValuesThrow) {
    Settings settings;
    EXPECT_THROW(load_config_file(write_config(test_root / "a.conf", "max_redirects=five\n"), settings), CrxgetException);
    EXPECT_THROW(load_config_file(write_config(test_root / "b.conf", "timeout=-1\n"), settings), CrxgetException);
    EXPECT_THROW(load_config_file(write_config(test_root / "c.conf", "max_redirects=3x\n"), settings), CrxgetException);
    EXPECT_THROW(load_config_file(write_config(test_root / "d.conf", "just some words\n"), settings), CrxgetException);
}

TEST_F(ConfigTest, UnknownKeyIsIgnored) {
    Settings settings;
    EXPECT_NO_THROW(load_config_file(write_config(test_root / "e.conf", "colour=blue\nmax_redirects=7\n"), settings));
    EXPECT_EQ(settings.max_redirects, 7);
}
