#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <sentinel/common/clock.hpp>
#include <sentinel/gate/evaluator.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/registry/control_registry.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

sentinel::schema::actor_t make_cli_actor(const std::string& name) {
  return sentinel::schema::actor_t{.id = sentinel::schema::make_id(name),
                                   .type = sentinel::schema::actor_type_t::user,
                                   .name = name};
}

int print_verify(sentinel::ledger::ledger& ledger,
                 const po::variables_map& vm) {
  auto result = sentinel::schema::verify_result_t{};
  if (vm.contains("from") || vm.contains("to")) {
    auto from = vm.contains("from") ? vm["from"].as<uint64_t>() : uint64_t{1};
    auto to = vm.contains("to") ? vm["to"].as<uint64_t>() : ledger.size();
    result = ledger.verify_chain(from, to);
  } else {
    result = ledger.verify_chain();
  }

  if (result.ok) {
    std::cout << fmt::format("chain intact: {} event(s) checked",
                             result.checked)
              << std::endl;
    return 0;
  }
  std::cout << fmt::format("chain broken at sequence {}: {}",
                           result.first_mismatch.value_or(0), result.log)
            << std::endl;
  return 2;
}

int print_history(const sentinel::ledger::ledger& ledger,
                  const po::variables_map& vm) {
  auto from = vm.contains("from") ? vm["from"].as<uint64_t>() : uint64_t{1};
  auto to = vm.contains("to") ? vm["to"].as<uint64_t>() : ledger.size();
  for (const auto& event : ledger.read_range(from, to)) {
    std::cout << fmt::format("#{} {} {} [{}] {} {}", event.sequence,
                             event.created_at,
                             sentinel::schema::to_string(event.type),
                             sentinel::schema::to_string(event.outcome),
                             event.actor.name, event.action)
              << std::endl;
  }
  return 0;
}

int run_evaluate(sentinel::gate::evaluator& evaluator,
                 const po::variables_map& vm) {
  if (!vm.contains("gate")) {
    std::cerr << "evaluate requires --gate" << std::endl;
    return 1;
  }
  auto request = sentinel::gate::evaluation_request{
      .gate_key = vm["gate"].as<std::string>(),
      .actor = make_cli_actor(vm["actor"].as<std::string>())};
  if (vm.contains("context")) {
    for (const auto& pair : vm["context"].as<std::vector<std::string>>()) {
      auto separator = pair.find('=');
      if (separator == std::string::npos || separator == 0) {
        std::cerr << fmt::format("malformed --context '{}', expected key=value",
                                 pair)
                  << std::endl;
        return 1;
      }
      request.context.insert_or_assign(
          pair.substr(0, separator),
          sentinel::schema::parse_context_value(pair.substr(separator + 1)));
    }
  }
  if (vm.contains("timeout-ms")) {
    request.timeout =
        std::chrono::milliseconds{vm["timeout-ms"].as<uint32_t>()};
  }

  auto decision = evaluator.evaluate(request);
  std::cout << fmt::format("{} execution={}",
                           sentinel::schema::to_string(decision.outcome),
                           sentinel::schema::to_hex(decision.execution_id));
  if (decision.ledger_sequence) {
    std::cout << fmt::format(" ledger=#{}", *decision.ledger_sequence);
  }
  if (!decision.log.empty()) {
    std::cout << fmt::format(" ({})", decision.log);
  }
  std::cout << std::endl;
  return decision.permits_execution() ? 0 : 3;
}

int print_execution(const sentinel::gate::evaluator& evaluator,
                    const po::variables_map& vm) {
  if (!vm.contains("id")) {
    std::cerr << "execution requires --id" << std::endl;
    return 1;
  }
  auto id = sentinel::schema::try_make_hash32(vm["id"].as<std::string>());
  if (!id) {
    std::cerr << "--id must be a 32-byte hex execution id" << std::endl;
    return 1;
  }
  auto execution = evaluator.find_execution(*id);
  if (!execution) {
    std::cerr << fmt::format("no gate execution {}", vm["id"].as<std::string>())
              << std::endl;
    return 1;
  }

  std::cout << fmt::format("{} at gate '{}' for {}: {} ({} ms)",
                           sentinel::schema::to_hex(execution->id),
                           execution->gate_key, execution->actor.name,
                           sentinel::schema::to_string(execution->outcome),
                           execution->duration)
            << std::endl;
  for (const auto& check : execution->kill_switch_checks) {
    std::cout << fmt::format("  kill switch {} {} {}", check.switch_key,
                             sentinel::schema::to_string(check.mode),
                             check.active ? "ACTIVE" : "inactive")
              << std::endl;
  }
  for (const auto& policy : execution->policy_results) {
    std::cout << fmt::format("  policy {} (priority {}) {} {}",
                             policy.policy_key, policy.priority,
                             sentinel::schema::to_string(policy.result),
                             policy.reason)
              << std::endl;
  }
  for (const auto& [name, value] : execution->evidence) {
    std::cout << fmt::format("  evidence {}={}", name, value) << std::endl;
  }
  for (const auto& error : execution->errors) {
    std::cout << fmt::format("  error {}", error) << std::endl;
  }
  return 0;
}

int run_kill_switch(sentinel::registry::control_registry& registry,
                    const po::variables_map& vm) {
  auto action = vm.contains("action") ? vm["action"].as<std::string>()
                                      : std::string{"list"};
  if (action == "list") {
    for (const auto& kill_switch : registry.list_kill_switches()) {
      std::cout << fmt::format(
                       "{} {} {} {}", kill_switch.key,
                       sentinel::schema::to_string(kill_switch.mode),
                       sentinel::schema::to_string(kill_switch.scope),
                       kill_switch.active ? "ACTIVE" : "inactive")
                << std::endl;
    }
    return 0;
  }

  if (!vm.contains("switch")) {
    std::cerr << fmt::format("kill-switch {} requires --switch", action)
              << std::endl;
    return 1;
  }
  auto key = vm["switch"].as<std::string>();
  auto actor = make_cli_actor(vm["actor"].as<std::string>());
  auto reason = vm.contains("reason") ? vm["reason"].as<std::string>()
                                      : std::string{};

  auto result = sentinel::schema::registry_result_t{};
  if (action == "activate") {
    result = registry.activate_kill_switch(
        key, actor,
        sentinel::registry::kill_switch_activation{.reason = reason});
  } else if (action == "deactivate") {
    result = registry.deactivate_kill_switch(key, actor, reason);
  } else {
    std::cerr << fmt::format("unknown kill-switch action '{}'", action)
              << std::endl;
    return 1;
  }

  if (!result.ok()) {
    std::cerr << fmt::format("{} [{}:{}]", result.log, result.codespace,
                             result.code)
              << std::endl;
    return 1;
  }
  std::cout << fmt::format("kill switch '{}' {}d (ledger #{})", key, action,
                           result.ledger_sequence.value_or(0))
            << std::endl;
  return 0;
}

// Owns the service stack; it is destroyed before the logger shuts down.
int dispatch(const po::variables_map& vm, const std::string& db_path) {
  auto store = sentinel::storage::make_storage<
      sentinel::storage::rocksdb_storage_tag>(db_path);
  auto clock = sentinel::common::system_clock();
  auto ledger = sentinel::ledger::ledger{store, clock};
  auto registry = sentinel::registry::control_registry{ledger, store, clock};
  auto evaluator = sentinel::gate::evaluator{
      ledger, store, registry.make_policy_source(), clock};

  auto command = vm["command"].as<std::string>();
  auto status = 1;
  if (command == "verify") {
    status = print_verify(ledger, vm);
  } else if (command == "history") {
    status = print_history(ledger, vm);
  } else if (command == "evaluate") {
    status = run_evaluate(evaluator, vm);
  } else if (command == "execution") {
    status = print_execution(evaluator, vm);
  } else if (command == "kill-switch") {
    status = run_kill_switch(registry, vm);
  } else if (command == "sweep") {
    std::cout << fmt::format("{} expired control(s) closed",
                             registry.sweep_expired())
              << std::endl;
    status = 0;
  } else {
    std::cerr << fmt::format("unknown command '{}'", command) << std::endl;
  }

  return status;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_path = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Sentinel"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("sentinel.db"),
      "RocksDB directory holding the ledger and registry")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("sentinel.log"),
      "Log file path")("config,c", po::value<std::string>(&config_path),
                       "INI file with any of the options above")(
      "from", po::value<uint64_t>(), "First ledger sequence")(
      "to", po::value<uint64_t>(), "Last ledger sequence")(
      "gate,g", po::value<std::string>(), "Gate key to evaluate")(
      "actor,a", po::value<std::string>()->default_value("cli"),
      "Acting principal")("context", po::value<std::vector<std::string>>(),
                          "Request context entry key=value (repeatable)")(
      "timeout-ms", po::value<uint32_t>(), "Evaluation timeout")(
      "id", po::value<std::string>(), "Gate execution id (hex)")(
      "switch,s", po::value<std::string>(), "Kill switch key")(
      "reason,r", po::value<std::string>(), "Activation reason or notes")(
      "command", po::value<std::string>(),
      "verify | history | evaluate | execution | kill-switch | sweep")(
      "action", po::value<std::string>(),
      "kill-switch: list | activate | deactivate");

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("action", 1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "cannot open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "sentinel", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto status = dispatch(vm, db_path);
  spdlog::shutdown();
  return status;
}
