#include <gtest/gtest.h>
#include <onft/chain/codec.hpp>
#include <onft/schema/primitives.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef ONFT_DEMO_PATH
#define ONFT_DEMO_PATH ""
#endif

namespace {

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, output};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status)) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string demo_path() {
  return std::string{ONFT_DEMO_PATH};
}

std::string line_value(const std::string& output, const std::string_view key) {
  auto prefix = std::string{key} + ": ";
  auto start = output.find(prefix);
  if (start == std::string::npos) {
    return {};
  }
  start += prefix.size();
  auto end = output.find('\n', start);
  return output.substr(start, end - start);
}

}  // namespace

TEST(onft_demo, builds_and_verifies_a_chain) {
  auto demo = demo_path();
  if (demo.empty() || !std::filesystem::exists(demo)) {
    GTEST_SKIP() << "onft_demo binary not available: " << demo;
  }
  auto [code, output] =
      run_capture(demo + " --payload hello --count 5 2>/dev/null");
  ASSERT_EQ(code, 0) << output;
  EXPECT_EQ(line_value(output, "length"), "7");
  EXPECT_EQ(line_value(output, "chain"), "verified 7 record(s)");
}

TEST(onft_demo, tampered_copy_is_reported) {
  auto demo = demo_path();
  if (demo.empty() || !std::filesystem::exists(demo)) {
    GTEST_SKIP() << "onft_demo binary not available: " << demo;
  }
  auto [code, output] = run_capture(
      demo + " --count 10 --digest sha256 --tamper 4 2>/dev/null");
  ASSERT_EQ(code, 0) << output;
  EXPECT_EQ(line_value(output, "chain"), "verified 11 record(s)");
  EXPECT_EQ(line_value(output, "tampered"),
            "NOT verified, 1 bad record(s), first at 4 (digest_mismatch)");
}

TEST(onft_demo, encoded_output_decodes_to_a_valid_chain) {
  auto demo = demo_path();
  if (demo.empty() || !std::filesystem::exists(demo)) {
    GTEST_SKIP() << "onft_demo binary not available: " << demo;
  }
  auto [code, output] =
      run_capture(demo + " -p first -p second --encode 2>/dev/null");
  ASSERT_EQ(code, 0) << output;

  auto bytes = onft::schema::try_from_hex(line_value(output, "encoded"));
  ASSERT_TRUE(bytes.has_value());
  auto decoded = onft::chain::try_decode_chain(
      onft::schema::bytes_view_t{bytes->data(), bytes->size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->size(), 3u);
  EXPECT_EQ(onft::schema::to_hex(decoded->back().self_digest),
            line_value(output, "tail"));
  EXPECT_TRUE(decoded->verify().verified);
}

TEST(onft_demo, capacity_limit_stops_appends) {
  auto demo = demo_path();
  if (demo.empty() || !std::filesystem::exists(demo)) {
    GTEST_SKIP() << "onft_demo binary not available: " << demo;
  }
  auto [code, output] =
      run_capture(demo + " --count 10 --max-length 4 2>/dev/null");
  ASSERT_EQ(code, 0) << output;
  EXPECT_EQ(line_value(output, "length"), "4");
  EXPECT_EQ(line_value(output, "chain"), "verified 4 record(s)");
}

TEST(onft_demo, rejects_unknown_digest_algorithm) {
  auto demo = demo_path();
  if (demo.empty() || !std::filesystem::exists(demo)) {
    GTEST_SKIP() << "onft_demo binary not available: " << demo;
  }
  auto [code, output] = run_capture(demo + " --digest md5 2>/dev/null");
  EXPECT_EQ(code, 2);
}
