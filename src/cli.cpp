#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "genledger/config.hpp"
#include "genledger/frames.hpp"
#include "genledger/hash.hpp"
#include "genledger/jsonlite.hpp"
#include "genledger/observability.hpp"
#include "genledger/pricing.hpp"
#include "genledger/process_client.hpp"
#include "genledger/service.hpp"
#include "genledger/store.hpp"
#include "genledger/version.hpp"
#include "genledger/worker.hpp"

#ifndef GENLEDGER_VERSION
#define GENLEDGER_VERSION "0.3.0"
#endif

namespace {

std::string arg_value(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] == flag) return argv[i + 1];
  }
  return "";
}

int cmd_health() {
  const auto h = genledger::hash_runtime_info();
  const auto cfg = genledger::load_config_from_env();
  std::cout << "{\"hash_primitive\":\"" << h.primitive << "\",\"hash_version\":\"" << h.version
            << "\",\"hash_available\":" << (h.blake3_available ? "true" : "false")
            << ",\"version\":"
            << genledger::version::manifest_to_json(
                   genledger::version::current_manifest(GENLEDGER_VERSION))
            << ",\"worker\":"
            << genledger::worker_identity_to_json(genledger::global_worker_identity())
            << ",\"config_ok\":" << (cfg.ok ? "true" : "false");
  if (cfg.ok) {
    std::cout << ",\"config\":" << genledger::config_to_json(cfg.config);
  } else {
    std::cout << ",\"config_error\":{\"code\":\"" << cfg.error_code << "\",\"message\":\""
              << genledger::jsonlite::escape(cfg.error_message) << "\"}";
  }
  std::cout << ",\"stats\":" << genledger::global_stats().to_json() << "}\n";
  return cfg.ok ? 0 : 2;
}

int cmd_serve(int argc, char** argv) {
  genledger::ConfigResult cfg;
  const std::string config_path = arg_value(argc, argv, "--config");
  if (!config_path.empty()) {
    cfg = genledger::load_config_file(config_path);
    if (cfg.ok) {
      cfg.config = genledger::apply_env_overrides(cfg.config);
      if (auto bad = genledger::validate_config(cfg.config); !bad.empty()) {
        cfg.ok = false;
        cfg.error_code = "config_invalid";
        cfg.error_message = bad;
      }
    }
  } else {
    cfg = genledger::load_config_from_env();
  }
  if (!cfg.ok) {
    std::cerr << genledger::error_frame("", cfg.error_code, cfg.error_message) << "\n";
    return 2;
  }
  const genledger::Config& config = cfg.config;
  if (config.provider_command.empty()) {
    std::cerr << genledger::error_frame("", "config_invalid", "provider_command is required for serve") << "\n";
    return 2;
  }

  genledger::PriceTable prices;
  if (!config.price_table_path.empty()) {
    auto pt = genledger::load_price_table(config.price_table_path);
    if (!pt.ok) {
      std::cerr << genledger::error_frame("", pt.error_code, pt.error_message) << "\n";
      return 2;
    }
    prices = pt.table;
  }

  auto opened = genledger::MemoryLedgerStore::open(config.journal_path);
  if (!opened.ok) {
    std::cerr << genledger::error_frame("", opened.error_code, opened.error_message) << "\n";
    return 2;
  }
  if (opened.replay.torn_tail) {
    genledger::log(genledger::LogLevel::warn, "cli", "cut torn journal tail of " + config.journal_path);
  }

  genledger::init_worker_identity();
  genledger::ProcessJobClient client(config.provider_command, config.provider_timeout_ms);
  genledger::LedgerService svc(*opened.store, client, prices, config, genledger::wall_clock());
  svc.start();

  std::string models;
  for (const auto& m : prices.models()) models += (models.empty() ? "" : ",") + m;
  genledger::log(genledger::LogLevel::info, "cli",
                 "serving store=" + opened.store->backend_id() + " provider=" + client.client_id() +
                     " models=" + models);

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    std::cout << genledger::handle_frame(svc, line) << "\n" << std::flush;
  }

  svc.stop();
  return 0;
}

int cmd_verify(int argc, char** argv) {
  const std::string path = arg_value(argc, argv, "--journal");
  if (path.empty()) {
    std::cerr << "usage: genledger_cli verify --journal <path>\n";
    return 2;
  }
  const auto v = genledger::verify_journal(path);
  std::cout << v.report_json << "\n";
  return v.exit_code;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) {
      ++i;  // flag value
      continue;
    }
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: genledger_cli <health|serve|verify> [--config <path>] [--journal <path>]\n";
    return 1;
  }

  if (cmd == "health") return cmd_health();
  if (cmd == "serve") return cmd_serve(argc, argv);
  if (cmd == "verify") return cmd_verify(argc, argv);

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}
