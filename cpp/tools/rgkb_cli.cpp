#include "rgkb/config.hpp"
#include "rgkb/embeddings.hpp"
#include "rgkb/errors.hpp"
#include "rgkb/knowledge_orchestrator.hpp"
#include "rgkb/logging.hpp"
#include "rgkb/report_json.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
  std::cerr << "usage: rgkb_cli [--config FILE] [--offline] <command> [args]\n"
               "commands:\n"
               "  index [--force]                    load or build the vector index\n"
               "  search <query> [max]               retrieve context for a query\n"
               "  methodology <name> <query> [max]   keyword search for MAGERIT, OCTAVE, ISO27001 or NIST\n"
               "  test                               run the retrieval test queries\n"
               "  health                             report component health\n"
               "  stats                              report knowledge base statistics\n"
               "  cleanup                            delete the persisted snapshot\n";
}

// Document text read from disk may hold non-UTF-8 bytes; print those as U+FFFD.
void PrintJson(const nlohmann::json& value) {
  std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

struct CliOptions {
  std::optional<std::filesystem::path> config_path;
  bool offline = false;
  std::string command;
  std::vector<std::string> args;
};

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
  CliOptions options{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (options.command.empty() && arg == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      options.config_path = argv[++i];
      continue;
    }
    if (options.command.empty() && arg == "--offline") {
      options.offline = true;
      continue;
    }
    if (options.command.empty()) {
      options.command = arg;
      continue;
    }
    options.args.push_back(arg);
  }
  if (options.command.empty()) {
    return std::nullopt;
  }
  return options;
}

int ParseMax(const std::vector<std::string>& args, std::size_t index, int fallback) {
  if (args.size() <= index) {
    return fallback;
  }
  try {
    const int value = std::stoi(args[index]);
    if (value <= 0) {
      throw rgkb::ConfigError("max must be positive");
    }
    return value;
  } catch (const std::logic_error&) {
    throw rgkb::ConfigError("max must be a positive integer, got '" + args[index] + "'");
  }
}

nlohmann::json OutcomeJson(const rgkb::RetrievalOutcome& outcome) {
  nlohmann::json hits = nlohmann::json::array();
  for (const auto& hit : outcome.hits) {
    hits.push_back(rgkb::ToJson(hit));
  }
  nlohmann::json out = {
      {"status", outcome.ok() ? "ok" : (outcome.degraded() ? "degraded" : "cancelled")},
      {"results", hits},
  };
  if (outcome.error.has_value()) {
    out["error"] = *outcome.error;
  }
  return out;
}

int Run(const CliOptions& options) {
  auto config = rgkb::LoadKnowledgeConfig(options.config_path);
  rgkb::SetLogLevel(config.log_level);

  std::shared_ptr<rgkb::BatchEmbeddingProvider> embedder{};
  if (options.offline) {
    embedder = std::make_shared<rgkb::HashingEmbedder>();
  }
  rgkb::KnowledgeOrchestrator orchestrator(config, embedder);

  const auto& command = options.command;
  const auto& args = options.args;

  if (command == "cleanup") {
    orchestrator.Cleanup();
    std::cout << "snapshot removed from " << config.persist_directory << "\n";
    return kExitOk;
  }

  if (command == "health") {
    try {
      orchestrator.Initialize();
    } catch (const rgkb::KnowledgeError& ex) {
      rgkb::Logger()->error("initialization failed: {}", ex.what());
    }
    const auto report = orchestrator.HealthCheck();
    PrintJson(rgkb::ToJson(report));
    return report.status == rgkb::HealthStatus::kHealthy ? kExitOk : kExitFailure;
  }

  if (command == "index") {
    if (!args.empty() && args.front() == "--force") {
      orchestrator.Reinitialize(true);
    } else {
      orchestrator.Initialize();
    }
    PrintJson(rgkb::ToJson(orchestrator.GetStats()));
    return kExitOk;
  }

  if (command == "stats") {
    orchestrator.Initialize();
    PrintJson(rgkb::ToJson(orchestrator.GetStats()));
    return kExitOk;
  }

  if (command == "test") {
    orchestrator.Initialize();
    PrintJson(rgkb::ToJson(orchestrator.TestRetrieval()));
    return kExitOk;
  }

  if (command == "search") {
    if (args.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    orchestrator.Initialize();
    const auto outcome = orchestrator.SearchRelevantContext(args[0], ParseMax(args, 1, 5));
    PrintJson(OutcomeJson(outcome));
    if (!outcome.hits.empty()) {
      std::cout << "\n" << orchestrator.FormatForPrompt(outcome.hits);
    }
    return outcome.ok() ? kExitOk : kExitFailure;
  }

  if (command == "methodology") {
    if (args.size() < 2) {
      PrintUsage();
      return kExitUsage;
    }
    orchestrator.Initialize();
    const auto outcome = orchestrator.SearchByMethodology(args[1], args[0], ParseMax(args, 2, 5));
    PrintJson(OutcomeJson(outcome));
    return outcome.ok() ? kExitOk : kExitFailure;
  }

  PrintUsage();
  return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options.has_value()) {
    PrintUsage();
    return kExitUsage;
  }
  try {
    return Run(*options);
  } catch (const rgkb::ConfigError& ex) {
    std::cerr << "configuration error: " << ex.what() << "\n";
    return kExitUsage;
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return kExitFailure;
  }
}
