#include <sentinel/gate/policy_source.hpp>

namespace sentinel::gate {

bool in_scope(const schema::kill_switch_t& kill_switch,
              const kill_switch_query& query) {
  return std::visit(
      overloaded{[](const schema::global_scope_t&) { return true; },
                 [&](const schema::workflow_scope_t& scope) {
                   return query.workflow_id == scope.workflow_id;
                 },
                 [&](const schema::capability_scope_t& scope) {
                   return query.capability_id == scope.capability_id;
                 }},
      kill_switch.scope);
}

}  // namespace sentinel::gate
