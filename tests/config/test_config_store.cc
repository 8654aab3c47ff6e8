#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <gtest/gtest.h>

#include "conductor/config/config_store.h"

using namespace conductor::config;
namespace fs = std::filesystem;

class ConfigStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("conductor_config_test_" + std::to_string(::getpid()));
    fs::remove_all(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  std::string path(const std::string& name) { return (dir_ / name).string(); }

  void write(const std::string& name, const std::string& content) {
    fs::create_directories(dir_);
    std::ofstream out(path(name));
    out << content;
  }

  fs::path dir_;
};

TEST_F(ConfigStoreTest, CreatesDefaultFileWhenMissing) {
  ConfigStore store(path("nested/dir/mcp_services.json"));
  EXPECT_FALSE(store.exists());

  ServiceConfigFile config = store.loadOrCreateDefault();
  EXPECT_TRUE(store.exists());
  ASSERT_EQ(config.services.size(), 2u);
  EXPECT_EQ(config.services[0].id, "filesystem");
  EXPECT_EQ(config.services[0].name, "File System");
  EXPECT_EQ(config.services[0].command.value_or(""), "mcp-server-filesystem");
  EXPECT_FALSE(config.services[0].auto_start);
  EXPECT_EQ(config.services[1].id, "brave_search");
  EXPECT_EQ(config.services[1].connection_type, ConnectionType::Subprocess);
  ASSERT_TRUE(config.services[1].args.has_value());
  EXPECT_TRUE(config.services[1].args->empty());
}

TEST_F(ConfigStoreTest, SaveThenLoadJson) {
  ServiceConfigFile config;
  ServiceDescriptor d;
  d.id = "remote";
  d.connection_type = ConnectionType::Http;
  d.endpoint = "http://127.0.0.1:8080/mcp";
  d.timeout = 10;
  config.services.push_back(d);

  ConfigStore store(path("services.json"));
  store.save(config);
  EXPECT_FALSE(fs::exists(path("services.json.tmp")));

  ServiceConfigFile loaded = store.load();
  EXPECT_EQ(loaded.version, "1.0.0");
  ASSERT_EQ(loaded.services.size(), 1u);
  EXPECT_EQ(loaded.services[0], d);
}

TEST_F(ConfigStoreTest, FailedFlushKeepsPreviousFile) {
  if (!fs::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  ServiceConfigFile original = ConfigStore::defaultConfig();
  ConfigStore store(path("services.json"));
  store.save(original);

  // The buffered content only hits the device when the stream is flushed
  fs::create_symlink("/dev/full", path("services.json.tmp"));

  ServiceConfigFile changed = original;
  changed.services.pop_back();
  EXPECT_THROW(store.save(changed), ConfigParseError);

  EXPECT_FALSE(fs::is_symlink(fs::symlink_status(path("services.json"))));
  EXPECT_FALSE(fs::exists(fs::symlink_status(path("services.json.tmp"))));
  ServiceConfigFile loaded = store.load();
  EXPECT_EQ(loaded.services.size(), original.services.size());
}

TEST_F(ConfigStoreTest, LoadsYaml) {
  write("services.yaml", R"(
version: "1.0.0"
services:
  - id: git
    name: Git
    connection_type: stdio
    command: mcp-server-git
    args: ["--repository", "/src"]
    env:
      GIT_PAGER: cat
    auto_start: false
    max_retries: 1
    timeout: 15
    metadata:
      tier: 2
  - id: ws
    connection_type: websocket
    endpoint: ws://localhost:9000/mcp
)");

  ConfigStore store(path("services.yaml"));
  EXPECT_TRUE(store.isYaml());
  ServiceConfigFile config = store.load();
  ASSERT_EQ(config.services.size(), 2u);

  const auto& git = config.services[0];
  EXPECT_EQ(git.connection_type, ConnectionType::Stdio);
  EXPECT_EQ(git.args->size(), 2u);
  EXPECT_EQ(git.env->at("GIT_PAGER"), "cat");
  EXPECT_FALSE(git.auto_start);
  EXPECT_EQ(git.max_retries, 1);
  EXPECT_EQ(git.timeout, 15);
  EXPECT_EQ((*git.metadata)["tier"].getInt(), 2);

  EXPECT_EQ(config.services[1].endpoint, "ws://localhost:9000/mcp");
}

TEST_F(ConfigStoreTest, YamlSaveKeepsNumericLookingStrings) {
  ServiceConfigFile config;
  ServiceDescriptor d;
  d.id = "numbers";
  d.command = "server";
  d.args = std::vector<std::string>{"8080", "true"};
  config.services.push_back(d);

  ConfigStore store(path("services.yml"));
  store.save(config);
  ServiceConfigFile loaded = store.load();
  ASSERT_EQ(loaded.services.size(), 1u);
  EXPECT_EQ(loaded.services[0], d);
}

TEST_F(ConfigStoreTest, MalformedJsonIsParseError) {
  write("broken.json", "{ \"services\": [ ");
  ConfigStore store(path("broken.json"));
  EXPECT_THROW(store.load(), ConfigParseError);
}

TEST_F(ConfigStoreTest, ErrorNamesServiceField) {
  write("bad.json",
        R"({"services": [{"id": "a", "command": "x"}, {"id": "b", "timeout": -1}]})");
  ConfigStore store(path("bad.json"));
  try {
    store.load();
    FAIL() << "expected ConfigParseError";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.field(), "services[1].timeout");
    EXPECT_EQ(e.file(), path("bad.json"));
  }
}
