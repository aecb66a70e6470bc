#include "minitest.hpp"
#include "collectors/StatDecoder.hpp"
#include <cmath>
#include <string>

using rmon::collectors::decode_stat;
using rmon::model::StatSnapshot;

TEST(decoder_full_body) {
  const char* body = R"({
    "version": "3.8.4",
    "uptime": 86400,
    "scanned": 1200,
    "actions": {"reject": 10, "no action": 1100, "add header": 90, "greylist": 0},
    "scan_times": [0.5, 1.5, null, "x", 1.0]
  })";
  StatSnapshot s;
  std::string err;
  ASSERT_TRUE(decode_stat(body, s, err));
  ASSERT_TRUE(s.actions.has_value());
  ASSERT_EQ(s.actions->size(), 4u);
  ASSERT_EQ(s.actions->at("reject"), 10u);
  ASSERT_EQ(s.actions->at("no action"), 1100u);
  ASSERT_TRUE(s.scan_times.has_value());
  ASSERT_EQ(s.scan_times->size(), 5u);
  ASSERT_EQ((*s.scan_times)[0], 0.5);
  ASSERT_TRUE(std::isnan((*s.scan_times)[2]));
  ASSERT_TRUE(std::isnan((*s.scan_times)[3]));
  ASSERT_EQ((*s.scan_times)[4], 1.0);
  ASSERT_EQ(s.version, "3.8.4");
  ASSERT_EQ(*s.uptime, 86400u);
  ASSERT_EQ(*s.scanned, 1200u);
}

TEST(decoder_missing_fields_left_empty) {
  StatSnapshot s;
  std::string err;
  ASSERT_TRUE(decode_stat(R"({"scanned": 5})", s, err));
  ASSERT_TRUE(!s.actions.has_value());
  ASSERT_TRUE(!s.scan_times.has_value());
  ASSERT_TRUE(s.version.empty());
  ASSERT_TRUE(!s.uptime.has_value());
}

TEST(decoder_wrong_types_ignored) {
  StatSnapshot s;
  std::string err;
  ASSERT_TRUE(decode_stat(R"({"actions": [1, 2], "scan_times": {"a": 1}})", s, err));
  ASSERT_TRUE(!s.actions.has_value());
  ASSERT_TRUE(!s.scan_times.has_value());
}

TEST(decoder_bad_counts_become_zero) {
  StatSnapshot s;
  std::string err;
  ASSERT_TRUE(decode_stat(R"({"actions": {"reject": -3, "no action": 2.5, "add header": "7"}})", s, err));
  ASSERT_EQ(s.actions->at("reject"), 0u);
  ASSERT_EQ(s.actions->at("no action"), 0u);
  ASSERT_EQ(s.actions->at("add header"), 0u);
}

TEST(decoder_rejects_malformed) {
  StatSnapshot s;
  std::string err;
  ASSERT_TRUE(!decode_stat("{\"actions\": {", s, err));
  ASSERT_TRUE(!err.empty());
  err.clear();
  ASSERT_TRUE(!decode_stat("[1, 2, 3]", s, err));
  ASSERT_TRUE(!err.empty());
  ASSERT_TRUE(!decode_stat("", s, err));
}

TEST(decoder_resets_previous_contents) {
  StatSnapshot s;
  s.version = "old";
  s.actions.emplace();
  std::string err;
  ASSERT_TRUE(decode_stat("{}", s, err));
  ASSERT_TRUE(s.version.empty());
  ASSERT_TRUE(!s.actions.has_value());
}
