#include <sentinel/schema/key/builder.hpp>
#include <sentinel/schema/key/keys.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

namespace sentinel::schema::key {

namespace {

bytes_t make_record_key(const std::string_view& prefix, const hash32_t& id) {
  auto b = builder{};
  b.write(prefix);
  b.write(id);
  return b.data;
}

}  // namespace

bytes_t make_prefix(const std::string_view& prefix) {
  return make_bytes(prefix);
}

bytes_t make_ledger_event_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kLedgerEventPrefix);
  b.write(sequence);
  return b.data;
}

std::optional<uint64_t> parse_ledger_event_key(const bytes_view_t& key) {
  if (key.size() != kLedgerEventPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (make_string_view(key.first(kLedgerEventPrefix.size())) !=
      kLedgerEventPrefix) {
    return std::nullopt;
  }
  auto big = uint64_t{};
  std::memcpy(&big, key.data() + kLedgerEventPrefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

bytes_t make_ledger_tip_key() {
  return make_bytes(kLedgerTipKey);
}

bytes_t make_kill_switch_key(const hash32_t& id) {
  return make_record_key(kKillSwitchPrefix, id);
}

bytes_t make_control_policy_key(const hash32_t& id) {
  return make_record_key(kControlPolicyPrefix, id);
}

bytes_t make_enforcement_gate_key(const hash32_t& id) {
  return make_record_key(kEnforcementGatePrefix, id);
}

bytes_t make_break_glass_key(const hash32_t& id) {
  return make_record_key(kBreakGlassPrefix, id);
}

bytes_t make_gate_execution_key(const hash32_t& id) {
  return make_record_key(kGateExecutionPrefix, id);
}

bytes_t make_change_request_key(const hash32_t& id) {
  return make_record_key(kChangeRequestPrefix, id);
}

}  // namespace sentinel::schema::key
