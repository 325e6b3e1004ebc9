#pragma once

#include <onft/chain/chain.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace onft::chain {

/// A chain shared between threads.
///
/// Appends take the lock exclusively; verification and reads share it, so a
/// verify never observes a partially appended tail.
class synchronized_chain final {
 public:
  synchronized_chain() = default;
  explicit synchronized_chain(chain inner);

  synchronized_chain(const synchronized_chain&) = delete;
  synchronized_chain& operator=(const synchronized_chain&) = delete;

  onft::schema::push_result push(const onft::schema::bytes_view_t& payload);
  onft::schema::push_result push_signed(
      const onft::schema::bytes_view_t& payload,
      const onft::crypto::ed25519_keypair& owner);
  onft::schema::push_result extend(
      const std::vector<onft::schema::bytes_t>& payloads);

  onft::schema::verify_result verify() const;
  uint64_t size() const;
  std::optional<onft::schema::record_t> record_at(uint64_t index) const;
  std::optional<uint64_t> find(const chain_query_t& query) const;

  /// Copy of the whole chain taken under the shared lock.
  chain snapshot() const;

  /// Run `fn(const chain&)` under the shared lock.
  template <typename Fn>
  decltype(auto) read(Fn&& fn) const {
    auto lock = std::shared_lock{mutex_};
    return std::forward<Fn>(fn)(static_cast<const chain&>(chain_));
  }

 private:
  mutable std::shared_mutex mutex_;
  chain chain_;
};

}  // namespace onft::chain
