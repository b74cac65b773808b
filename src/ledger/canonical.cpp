#include <sentinel/blake3/hash.hpp>
#include <sentinel/ledger/canonical.hpp>
#include <sentinel/schema/key/builder.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>

namespace sentinel::ledger {

namespace {

enum class field_tag : uint8_t {
  version = 0x01,
  sequence = 0x02,
  type = 0x03,
  action = 0x04,
  actor = 0x05,
  resource = 0x06,
  outcome = 0x07,
  context = 0x08,
  created_at = 0x09,
};

enum class value_tag : uint8_t {
  absent = 0x00,
  present = 0x01,
  null = 0x10,
  boolean = 0x11,
  integer = 0x12,
  string = 0x13,
};

struct canonical_writer final {
  schema::key::builder out;

  void tag(const field_tag value) { out.write(static_cast<uint8_t>(value)); }

  void tag(const value_tag value) { out.write(static_cast<uint8_t>(value)); }

  void text(const std::string_view value) {
    out.write(static_cast<uint32_t>(value.size()));
    out.write(value);
  }

  void hash(const schema::hash32_t& value) { out.write(value); }

  void context_value(const schema::context_value_t& value) {
    std::visit(overloaded{[this](const std::monostate&) {
                            tag(value_tag::null);
                          },
                          [this](const bool v) {
                            tag(value_tag::boolean);
                            out.write(static_cast<uint8_t>(v ? 1 : 0));
                          },
                          [this](const int64_t v) {
                            tag(value_tag::integer);
                            out.write(v);
                          },
                          [this](const std::string& v) {
                            tag(value_tag::string);
                            text(v);
                          }},
               value);
  }
};

}  // namespace

std::string format_iso8601(const schema::timestamp_milliseconds_t timestamp) {
  using namespace std::chrono;
  auto point = sys_time<milliseconds>{milliseconds{timestamp}};
  auto day = floor<days>(point);
  auto date = year_month_day{day};
  auto time = hh_mm_ss<milliseconds>{point - day};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count(),
                     time.subseconds().count());
}

schema::bytes_t canonical_bytes(const schema::audit_event_t& event) {
  auto w = canonical_writer{};

  w.tag(field_tag::version);
  w.out.write(event.version);

  w.tag(field_tag::sequence);
  w.out.write(event.sequence);

  w.tag(field_tag::type);
  w.text(schema::to_string(event.type));

  w.tag(field_tag::action);
  w.text(event.action);

  w.tag(field_tag::actor);
  w.hash(event.actor.id);
  w.text(schema::to_string(event.actor.type));
  w.text(event.actor.name);

  w.tag(field_tag::resource);
  if (event.resource) {
    w.tag(value_tag::present);
    w.text(event.resource->type);
    w.hash(event.resource->id);
    w.text(event.resource->name);
  } else {
    w.tag(value_tag::absent);
  }

  w.tag(field_tag::outcome);
  w.text(schema::to_string(event.outcome));

  // std::map iteration is already ascending by key.
  w.tag(field_tag::context);
  w.out.write(static_cast<uint32_t>(event.context.size()));
  for (const auto& [name, value] : event.context) {
    w.text(name);
    w.context_value(value);
  }

  w.tag(field_tag::created_at);
  w.text(format_iso8601(event.created_at));

  return std::move(w.out.data);
}

schema::hash32_t compute_event_hash(const schema::audit_event_t& event) {
  auto canonical = canonical_bytes(event);
  auto h = blake3::hasher{};
  h.update(std::span<const uint8_t>{canonical.data(), canonical.size()});
  if (event.previous_hash) {
    h.update(*event.previous_hash);
  }
  return h.finalize();
}

}  // namespace sentinel::ledger
