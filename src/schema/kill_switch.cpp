#include <sentinel/schema/kill_switch.hpp>

namespace sentinel::schema {

std::string to_string(const kill_switch_scope_t& scope) {
  return std::visit(
      overloaded{[](const global_scope_t&) { return std::string{"GLOBAL"}; },
                 [](const workflow_scope_t& arg) {
                   return "WORKFLOW:" + to_hex(arg.workflow_id);
                 },
                 [](const capability_scope_t& arg) {
                   return "CAPABILITY:" + to_hex(arg.capability_id);
                 }},
      scope);
}

}  // namespace sentinel::schema
