#include <gtest/gtest.h>
#include <onft/chain/synchronized_chain.hpp>
#include <onft/testing/common.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using onft::chain::synchronized_chain;

TEST(synchronized_chain, concurrent_writers_and_verifiers_see_consistent_chain) {
  constexpr auto kWriters = 4;
  constexpr auto kPushesPerWriter = 50;
  constexpr auto kVerifiers = 3;

  auto shared = synchronized_chain{};
  auto writers_done = std::atomic<bool>{false};
  auto failed_verifications = std::atomic<int>{0};
  auto verifications = std::atomic<int>{0};

  auto verifiers = std::vector<std::thread>{};
  for (auto v = 0; v < kVerifiers; ++v) {
    verifiers.emplace_back([&] {
      do {
        auto result = shared.verify();
        if (!result.ok() || !result.verified) {
          ++failed_verifications;
        }
        ++verifications;
      } while (!writers_done.load());
    });
  }

  auto writers = std::vector<std::thread>{};
  for (auto w = 0; w < kWriters; ++w) {
    writers.emplace_back([&shared, w] {
      for (auto i = 0; i < kPushesPerWriter; ++i) {
        auto payload = std::to_string(w) + ":" + std::to_string(i);
        auto result = shared.push(onft::schema::make_bytes_view(payload));
        EXPECT_TRUE(result.ok());
      }
    });
  }

  for (auto& t : writers) {
    t.join();
  }
  writers_done = true;
  for (auto& t : verifiers) {
    t.join();
  }

  EXPECT_EQ(shared.size(), 1u + kWriters * kPushesPerWriter);
  EXPECT_GT(verifications.load(), 0);
  EXPECT_EQ(failed_verifications.load(), 0);

  auto final_result = shared.verify();
  ASSERT_TRUE(final_result.ok());
  EXPECT_TRUE(final_result.verified);
}

TEST(synchronized_chain, reads_return_copies_and_bounds_check) {
  auto shared = synchronized_chain{};
  ASSERT_TRUE(shared.extend(onft::testing::make_numbered_payloads(3)).ok());

  auto record = shared.record_at(2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->index, 2u);
  EXPECT_EQ(onft::schema::make_string(record->payload), "1");
  EXPECT_FALSE(shared.record_at(4).has_value());

  EXPECT_EQ(shared.find(onft::chain::query_by_digest{record->self_digest}),
            2u);
  auto tail_index =
      shared.read([](const onft::chain::chain& value) { return value.back().index; });
  EXPECT_EQ(tail_index, 3u);
}

TEST(synchronized_chain, snapshot_is_independent_of_later_appends) {
  auto shared = synchronized_chain{onft::chain::chain{
      onft::chain::chain_options{.max_length = 4}}};
  ASSERT_TRUE(shared.push(onft::schema::make_bytes_view(std::string{"a"})).ok());
  auto copy = shared.snapshot();
  ASSERT_TRUE(shared.push(onft::schema::make_bytes_view(std::string{"b"})).ok());

  EXPECT_EQ(copy.size(), 2u);
  EXPECT_EQ(shared.size(), 3u);
  EXPECT_TRUE(copy.verify().verified);

  ASSERT_TRUE(shared.push(onft::schema::make_bytes_view(std::string{"c"})).ok());
  auto refused = shared.push(onft::schema::make_bytes_view(std::string{"d"}));
  ASSERT_FALSE(refused.ok());
  EXPECT_EQ(refused.error->code,
            onft::schema::chain_error_code::capacity_exceeded);
}
