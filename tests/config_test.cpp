#include "test_support.hpp"
#include "utils/config.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
  PreviewConfig config;
  EXPECT_EQ(config.listen.to_string(), "127.0.0.1:23625");
  EXPECT_EQ(config.debounce, 50ms);
  EXPECT_EQ(config.write_timeout, 5000ms);
  EXPECT_FLOAT_EQ(config.scale, 2.0f);
  EXPECT_EQ(config.evict_max_age, 30u);
  EXPECT_TRUE(config.system_fonts);
  EXPECT_FALSE(config.root.has_value());
}

TEST(ConfigTest, ReadsEveryKey) {
  auto yaml = YAML::Load(R"(
host: 0.0.0.0:9000
root: docs
font_paths: [fonts, /opt/fonts]
system_fonts: false
debounce_ms: 120
write_timeout_ms: 750
scale: 1.5
evict_max_age: 10
)");

  PreviewConfig config = PreviewConfig::from_yaml(yaml);
  EXPECT_EQ(config.listen.host, "0.0.0.0");
  EXPECT_EQ(config.listen.port, 9000);
  EXPECT_EQ(config.root, fs::path("docs"));
  ASSERT_EQ(config.font_paths.size(), 2u);
  EXPECT_EQ(config.font_paths[1], fs::path("/opt/fonts"));
  EXPECT_FALSE(config.system_fonts);
  EXPECT_EQ(config.debounce, 120ms);
  EXPECT_EQ(config.write_timeout, 750ms);
  EXPECT_FLOAT_EQ(config.scale, 1.5f);
  EXPECT_EQ(config.evict_max_age, 10u);
}

TEST(ConfigTest, RejectsNonPositiveValues) {
  EXPECT_THROW(PreviewConfig::from_yaml(YAML::Load("debounce_ms: 0")),
               std::runtime_error);
  EXPECT_THROW(PreviewConfig::from_yaml(YAML::Load("scale: -1")),
               std::runtime_error);
}

TEST(ConfigTest, LoadResolvesPathsAgainstFileDirectory) {
  TempDir dir;
  fs::path file = dir.write("pagecast.yaml", "root: book\nfont_paths: [fonts]\n");

  PreviewConfig config = PreviewConfig::load(file);
  EXPECT_EQ(config.root, dir.path() / "book");
  EXPECT_EQ(config.font_paths.front(), dir.path() / "fonts");
}

TEST(ConfigTest, ExplicitMissingFileIsAnError) {
  TempDir dir;
  EXPECT_THROW(PreviewConfig::discover(dir.path() / "absent.yaml"),
               std::runtime_error);
}

TEST(ConfigTest, MalformedYamlIsReportedWithPath) {
  TempDir dir;
  fs::path file = dir.write("bad.yaml", "host: [unterminated\n");
  try {
    PreviewConfig::load(file);
    FAIL() << "expected an exception";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find(file.string()), std::string::npos);
  }
}

TEST(ListenAddressTest, ParsesHostAndPort) {
  auto address = ListenAddress::parse("localhost:8081");
  EXPECT_EQ(address.host, "localhost");
  EXPECT_EQ(address.port, 8081);

  auto v6 = ListenAddress::parse("[::1]:23625");
  EXPECT_EQ(v6.host, "::1");
  EXPECT_EQ(v6.to_string(), "[::1]:23625");
}

TEST(ListenAddressTest, RejectsMalformedAddresses) {
  EXPECT_THROW(ListenAddress::parse("localhost"), std::runtime_error);
  EXPECT_THROW(ListenAddress::parse("localhost:"), std::runtime_error);
  EXPECT_THROW(ListenAddress::parse("localhost:99999"), std::runtime_error);
  EXPECT_THROW(ListenAddress::parse("localhost:80x"), std::runtime_error);
}
