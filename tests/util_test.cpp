#include "logging.hpp"
#include "util.hpp"
#include <gtest/gtest.h>

using namespace webrepl;

TEST(Util, ParseHostPort) {
  std::string host;
  uint16_t port = 8266;
  ASSERT_TRUE(parse_host_port("192.168.4.1", host, port));
  EXPECT_EQ(host, "192.168.4.1");
  EXPECT_EQ(port, 8266);
  ASSERT_TRUE(parse_host_port("esp.local:9000", host, port));
  EXPECT_EQ(host, "esp.local");
  EXPECT_EQ(port, 9000);
  EXPECT_FALSE(parse_host_port("esp:notaport", host, port));
  EXPECT_FALSE(parse_host_port("esp:70000", host, port));
  EXPECT_FALSE(parse_host_port(":80", host, port));
}

TEST(Util, Hex) {
  EXPECT_EQ(bytes_to_hex({0x00, 0x1f, 0xab}), "001fab");
}

TEST(Util, BaseName) {
  EXPECT_EQ(base_name("/tmp/x/main.py"), "main.py");
  EXPECT_EQ(base_name("boot.py"), "boot.py");
}

TEST(Util, FileRoundTrip) {
  std::string path = ::testing::TempDir() + "webrepl_util_test.bin";
  std::vector<uint8_t> data{0, 1, 2, 255, '\n', '\r'};
  std::string err;
  ASSERT_TRUE(write_file(path, data, err)) << err;
  std::vector<uint8_t> back;
  ASSERT_TRUE(read_file(path, back, err)) << err;
  EXPECT_EQ(back, data);
  EXPECT_FALSE(read_file(path + ".missing", back, err));
  EXPECT_FALSE(err.empty());
}

TEST(Logging, ParseLevel) {
  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("debug", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  EXPECT_FALSE(parse_log_level("loud", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
}

TEST(Logging, LinesCarrySubsystemTag) {
  Logger::instance().set_level(LogLevel::INFO);
  testing::internal::CaptureStderr();
  Logger::instance().log(LogLevel::WARN, "transfer", "chunk %d", 7);
  Logger::instance().log(LogLevel::DEBUG, "transfer", "hidden");
  std::string out = testing::internal::GetCapturedStderr();
  EXPECT_NE(out.find("[WARN] webrepl.transfer: chunk 7\n"), std::string::npos);
  EXPECT_EQ(out.find("hidden"), std::string::npos);
}
