#include <gtest/gtest.h>
#include "config/ConfigFile.hpp"
#include "config/ConfigError.hpp"
#include "config/Resolver.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ferry::config;
using namespace ferry::types;

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("ferry_config_test_" + std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    void write(const fs::path& path, const std::string& body) const {
        std::ofstream out(path);
        out << body;
    }
};

TEST_F(ConfigFileTest, MissingFileIsNullopt) {
    EXPECT_FALSE(loadConfigFile(dir / "absent.toml").has_value());
}

TEST_F(ConfigFileTest, DirectoryIsUnreadable) {
    try {
        (void)loadConfigFile(dir);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ConfigErrorKind::ConfigFileUnreadable);
    }
}

TEST_F(ConfigFileTest, SyntaxErrorIsUnreadable) {
    write(dir / "broken.toml", "port = [2121\n");
    try {
        (void)loadConfigFile(dir / "broken.toml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ConfigErrorKind::ConfigFileUnreadable);
    }
}

TEST_F(ConfigFileTest, YamlDocumentIsUnreadable) {
    write(dir / "config.toml", "port: 2121\nusers:\n  - username: a\n");
    EXPECT_THROW((void)loadConfigFile(dir / "config.toml"), ConfigError);
}

TEST_F(ConfigFileTest, LoadsHandWrittenTemplate) {
    write(dir / "config.toml", R"(# FTP server configuration

# server
port = 2121
listen = "0.0.0.0"

# connection limits
max_cons = 256
max_cons_per_ip = 10

# passive_ports = [50000, 50100]

banner = "欢迎使用 FTP 服务器"

[[users]]
username = "user"
password = "123456"
perm = "elradfmw" # e l r a d f m w
# home = "./data/user"
)");

    const auto loaded = loadConfigFile(dir / "config.toml");
    ASSERT_TRUE(loaded.has_value());

    const auto res = resolve(loaded);
    EXPECT_FALSE(res.needs_persist);
    EXPECT_EQ(res.config->port, 2121);
    EXPECT_EQ(res.config->banner, "欢迎使用 FTP 服务器");
    ASSERT_EQ(res.config->users.size(), 1u);
    EXPECT_EQ(res.config->users[0].username, "user");
    EXPECT_EQ(res.config->users[0].permissions, PermissionSet::full());
}

TEST_F(ConfigFileTest, DefaultFileRoundTrips) {
    const auto first = resolve(std::nullopt);
    ASSERT_TRUE(first.needs_persist);

    const auto path = dir / "nested" / DEFAULT_CONFIG_NAME;
    writeConfigFile(path, *first.config);
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(path.filename(), "config.toml");

    const auto loaded = loadConfigFile(path);
    ASSERT_TRUE(loaded.has_value());

    const auto second = resolve(loaded);
    EXPECT_FALSE(second.needs_persist);
    EXPECT_EQ(second.config->port, first.config->port);
    EXPECT_EQ(second.config->listen_address, first.config->listen_address);
    EXPECT_EQ(second.config->language, first.config->language);
    EXPECT_EQ(second.config->users, first.config->users);
}

TEST_F(ConfigFileTest, OptionalFieldsArePersisted) {
    ServerConfig cfg;
    cfg.passive_ports = PassivePortRange{40000, 40010};
    cfg.banner = "Hello";
    cfg.users.push_back({.username = "ro", .password = "pw", .permissions = parsePermissions("elr"),
                         .home_directory = fs::path("/srv/ro")});

    const auto path = dir / "full.toml";
    writeConfigFile(path, cfg);

    const auto res = resolve(loadConfigFile(path));
    EXPECT_EQ(res.config->passive_ports, cfg.passive_ports);
    EXPECT_EQ(res.config->banner, "Hello");
    ASSERT_EQ(res.config->users.size(), 1u);
    EXPECT_EQ(res.config->users[0], cfg.users[0]);
}
