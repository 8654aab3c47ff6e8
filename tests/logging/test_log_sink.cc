#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include <gtest/gtest.h>

#include "conductor/json/json_bridge.h"
#include "conductor/logging/log_formatter.h"
#include "conductor/logging/log_sink.h"

using namespace conductor::logging;
namespace fs = std::filesystem;

namespace {

LogMessage makeMessage(const std::string& text) {
  LogMessage msg;
  msg.level = LogLevel::Warning;
  msg.message = text;
  msg.logger_name = "transport.http";
  msg.component = Component::Transport;
  return msg;
}

std::string readFile(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

class LogSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("conductor_sink_test_" + std::to_string(::getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

TEST_F(LogSinkTest, DefaultFormatterIncludesFields) {
  DefaultFormatter formatter;
  LogMessage msg = makeMessage("request failed");
  msg.service_id = "brave_search";
  msg.request_id = "abc";
  msg.key_values["status"] = "503";

  std::string line = formatter.format(msg);
  EXPECT_NE(line.find("[WARNING]"), std::string::npos);
  EXPECT_NE(line.find("[transport.http]"), std::string::npos);
  EXPECT_NE(line.find("[svc:brave_search]"), std::string::npos);
  EXPECT_NE(line.find("[req:abc]"), std::string::npos);
  EXPECT_NE(line.find("request failed"), std::string::npos);
  EXPECT_NE(line.find("status=503"), std::string::npos);
}

TEST_F(LogSinkTest, JsonFormatterProducesParsableRecord) {
  JsonFormatter formatter;
  LogMessage msg = makeMessage("timeout");
  msg.tool_name = "web_search";

  auto record = conductor::json::JsonValue::parse(formatter.format(msg));
  EXPECT_EQ(record["level"].getString(), "WARNING");
  EXPECT_EQ(record["logger"].getString(), "transport.http");
  EXPECT_EQ(record["component"].getString(), "transport");
  EXPECT_EQ(record["tool"].getString(), "web_search");
  EXPECT_EQ(record["message"].getString(), "timeout");
  EXPECT_FALSE(record.contains("service_id"));
}

TEST_F(LogSinkTest, FileSinkWritesFormattedLines) {
  fs::path file = dir_ / "conductor.log";
  RotatingFileSink::Config config;
  config.base_filename = file.string();
  config.auto_flush = true;

  {
    RotatingFileSink sink(config);
    sink.log(makeMessage("first"));
    sink.log(makeMessage("second"));
    sink.flush();
  }

  std::string content = readFile(file);
  EXPECT_NE(content.find("first"), std::string::npos);
  EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(LogSinkTest, FileSinkRotates) {
  fs::path file = dir_ / "rotating.log";
  RotatingFileSink::Config config;
  config.base_filename = file.string();
  config.max_file_size = 200;
  config.max_files = 2;
  config.auto_flush = true;

  {
    RotatingFileSink sink(config);
    for (int i = 0; i < 20; ++i) {
      sink.log(makeMessage("line number " + std::to_string(i)));
    }
  }

  EXPECT_TRUE(fs::exists(file));
  EXPECT_TRUE(fs::exists(file.string() + ".1"));
  EXPECT_FALSE(fs::exists(file.string() + ".3"));
}

TEST_F(LogSinkTest, ExternalSinkReceivesFormattedText) {
  LogLevel seen_level = LogLevel::Debug;
  std::string seen_name;
  std::string seen_text;
  auto sink = SinkFactory::createExternalSink(
      [&](LogLevel level, const std::string& name, const std::string& text) {
        seen_level = level;
        seen_name = name;
        seen_text = text;
      });

  sink->log(makeMessage("forwarded"));
  EXPECT_EQ(seen_level, LogLevel::Warning);
  EXPECT_EQ(seen_name, "transport.http");
  EXPECT_NE(seen_text.find("forwarded"), std::string::npos);
  EXPECT_EQ(sink->type(), SinkType::External);
}

TEST_F(LogSinkTest, CustomFormatterOnSink) {
  std::string seen_text;
  auto sink = SinkFactory::createExternalSink(
      [&](LogLevel, const std::string&, const std::string& text) {
        seen_text = text;
      });
  sink->setFormatter(std::make_unique<JsonFormatter>());
  sink->log(makeMessage("as json"));

  auto record = conductor::json::JsonValue::parse(seen_text);
  EXPECT_EQ(record["message"].getString(), "as json");
}

TEST_F(LogSinkTest, FactoryTypes) {
  EXPECT_EQ(SinkFactory::createNullSink()->type(), SinkType::Null);
  EXPECT_EQ(SinkFactory::createStdioSink()->type(), SinkType::Stdio);
  auto file_sink =
      SinkFactory::createFileSink((dir_ / "factory.log").string());
  EXPECT_EQ(file_sink->type(), SinkType::File);
  EXPECT_TRUE(file_sink->supportsRotation());
}
