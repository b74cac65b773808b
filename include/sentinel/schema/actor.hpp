#pragma once

#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: actor.
// Governance workflow: who performed an action; recorded on every ledger
// event, gate execution and change-request sign-off.
namespace sentinel::schema {

enum class actor_type_t : uint8_t {
  user = 0,
  agent = 1,
  system = 2,
  service = 3,
  api_key = 4,
};

inline constexpr auto kActorTypeMappings = std::array{
    enum_mapping_t<actor_type_t>{"user", actor_type_t::user},
    enum_mapping_t<actor_type_t>{"agent", actor_type_t::agent},
    enum_mapping_t<actor_type_t>{"system", actor_type_t::system},
    enum_mapping_t<actor_type_t>{"service", actor_type_t::service},
    enum_mapping_t<actor_type_t>{"api_key", actor_type_t::api_key},
};

template <>
inline std::optional<actor_type_t> try_from_string<actor_type_t>(
    const std::string_view value) {
  return from_string(value, kActorTypeMappings);
}

inline constexpr std::string_view to_string(const actor_type_t value) {
  return to_string(value, kActorTypeMappings).value_or("unknown");
}

struct actor_t final {
  hash32_t id{};
  actor_type_t type{actor_type_t::user};
  std::string name;

  bool operator==(const actor_t&) const = default;
};

inline actor_t make_system_actor(const std::string_view name) {
  return actor_t{.id = make_id(name),
                 .type = actor_type_t::system,
                 .name = std::string{name}};
}

}  // namespace sentinel::schema
