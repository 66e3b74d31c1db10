#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "lanlink/logging/log_formatter.h"
#include "lanlink/logging/log_sink.h"

#include "../config/test_filesystem_utils.h"

using namespace lanlink::logging;
using lanlink::test::pathExists;
using lanlink::test::readFile;

namespace {

LogMessage makeMessage(LogLevel level, const std::string& text) {
  LogMessage msg;
  msg.level = level;
  msg.message = text;
  msg.logger_name = "server";
  return msg;
}

}  // namespace

TEST(LogFormatterTest, TextFormatIncludesLevelLoggerAndPeer) {
  TextFormatter formatter;
  auto msg = makeMessage(LogLevel::Warning, "keepalive timeout");
  msg.peer = "192.168.1.20:5000";

  std::string line = formatter.format(msg);
  EXPECT_NE(line.find("[WARNING]"), std::string::npos);
  EXPECT_NE(line.find("[server]"), std::string::npos);
  EXPECT_NE(line.find("[peer:192.168.1.20:5000]"), std::string::npos);
  EXPECT_NE(line.find("keepalive timeout"), std::string::npos);
}

TEST(LogFormatterTest, DebugLinesCarryLocation) {
  TextFormatter formatter;
  auto msg = makeMessage(LogLevel::Debug, "state change");
  msg.file = "discovery_client.cc";
  msg.line = 99;

  EXPECT_NE(formatter.format(msg).find("(discovery_client.cc:99)"),
            std::string::npos);

  msg.level = LogLevel::Info;
  EXPECT_EQ(formatter.format(msg).find("discovery_client.cc"),
            std::string::npos);
}

TEST(LogFormatterTest, JsonFormatIsOneObject) {
  JsonFormatter formatter;
  auto msg = makeMessage(LogLevel::Error, "bind failed");
  msg.peer = "0.0.0.0:8090";
  msg.fields["errno"] = "98";

  auto parsed = nlohmann::json::parse(formatter.format(msg));
  EXPECT_EQ(parsed["level"], "ERROR");
  EXPECT_EQ(parsed["logger"], "server");
  EXPECT_EQ(parsed["message"], "bind failed");
  EXPECT_EQ(parsed["peer"], "0.0.0.0:8090");
  EXPECT_EQ(parsed["metadata"]["errno"], "98");
}

class RotatingFileSinkTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(dir_.valid()); }

  lanlink::test::ScopedTempDir dir_{"lanlink_log"};
};

TEST_F(RotatingFileSinkTest, WritesLines) {
  std::string path = dir_.file("lanlink.log");
  {
    auto sink = SinkFactory::createFileSink(path);
    EXPECT_EQ(sink->type(), SinkType::File);
    EXPECT_TRUE(sink->supportsRotation());
    sink->log(makeMessage(LogLevel::Info, "first"));
    sink->log(makeMessage(LogLevel::Info, "second"));
    sink->flush();
  }

  std::string content = readFile(path);
  EXPECT_NE(content.find("first"), std::string::npos);
  EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(RotatingFileSinkTest, UsesConfiguredFormatter) {
  std::string path = dir_.file("structured.log");
  {
    auto sink = SinkFactory::createFileSink(path);
    sink->setFormatter(std::unique_ptr<Formatter>(new JsonFormatter()));
    sink->log(makeMessage(LogLevel::Info, "structured"));
  }

  std::string content = readFile(path);
  ASSERT_FALSE(content.empty());
  auto parsed = nlohmann::json::parse(content.substr(0, content.find('\n')));
  EXPECT_EQ(parsed["message"], "structured");
  EXPECT_EQ(parsed["logger"], "server");
}

/**
 * Test: Exceeding the size limit moves the file aside and starts a new one
 */
TEST_F(RotatingFileSinkTest, RotatesWhenFull) {
  RotatingFileSink::Options options;
  options.path = dir_.file("rotate.log");
  options.max_bytes = 200;
  options.max_files = 2;

  {
    RotatingFileSink sink(options);
    ASSERT_TRUE(sink.isOpen());
    for (int i = 0; i < 20; ++i) {
      sink.log(makeMessage(LogLevel::Info, "line " + std::to_string(i)));
    }
  }

  EXPECT_TRUE(pathExists(options.path));
  EXPECT_TRUE(pathExists(options.path + ".1"));
  EXPECT_TRUE(pathExists(options.path + ".2"));
  EXPECT_FALSE(pathExists(options.path + ".3"));

  std::string current = readFile(options.path);
  EXPECT_NE(current.find("line 19"), std::string::npos);
  EXPECT_LE(current.size(), options.max_bytes);
}
