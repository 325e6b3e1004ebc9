#include <onft/chain/synchronized_chain.hpp>

namespace onft::chain {

synchronized_chain::synchronized_chain(chain inner)
    : chain_{std::move(inner)} {}

onft::schema::push_result synchronized_chain::push(
    const onft::schema::bytes_view_t& payload) {
  auto lock = std::unique_lock{mutex_};
  return chain_.push(payload);
}

onft::schema::push_result synchronized_chain::push_signed(
    const onft::schema::bytes_view_t& payload,
    const onft::crypto::ed25519_keypair& owner) {
  auto lock = std::unique_lock{mutex_};
  return chain_.push_signed(payload, owner);
}

onft::schema::push_result synchronized_chain::extend(
    const std::vector<onft::schema::bytes_t>& payloads) {
  auto lock = std::unique_lock{mutex_};
  return chain_.extend(payloads);
}

onft::schema::verify_result synchronized_chain::verify() const {
  auto lock = std::shared_lock{mutex_};
  return chain_.verify();
}

uint64_t synchronized_chain::size() const {
  auto lock = std::shared_lock{mutex_};
  return chain_.size();
}

std::optional<onft::schema::record_t> synchronized_chain::record_at(
    const uint64_t index) const {
  auto lock = std::shared_lock{mutex_};
  if (index >= chain_.size()) {
    return std::nullopt;
  }
  return chain_[index];
}

std::optional<uint64_t> synchronized_chain::find(
    const chain_query_t& query) const {
  auto lock = std::shared_lock{mutex_};
  return chain_.find(query);
}

chain synchronized_chain::snapshot() const {
  auto lock = std::shared_lock{mutex_};
  return chain_;
}

}  // namespace onft::chain
