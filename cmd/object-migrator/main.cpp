#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using migrator::config::CommandLineOverrides;
using migrator::config::ConfigLoader;
using migrator::observability::StringField;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

struct CommandLine {
  std::optional<std::string> config_path;
  CommandLineOverrides       overrides;
  bool                       help = false;
};

void Usage(std::ostream& out) {
  out << "Usage:\n"
      << "  object-migrator --config <config.yaml> [overrides]\n"
      << "  object-migrator --source-container <name> --destination-bucket <name> --max-workers <n>\n"
      << "                  --region <region> --bandwidth-limit-mb <n> [--source-uri <uri>] [--destination-uri <uri>]\n"
      << "\n"
      << "Exit status: 0 ok, 1 usage or configuration error, 2 fatal error, 3 failed objects or count mismatch\n";
}

uint32_t ParseCount(const std::string& flag, const std::string& value) {
  std::size_t   consumed = 0;
  unsigned long parsed   = 0;
  try {
    parsed = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
  }
  if (consumed != value.size() || parsed == 0 || parsed > UINT32_MAX) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
  }
  return static_cast<uint32_t>(parsed);
}

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine cli;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;

    if (arg == "-h" || arg == "--help") {
      cli.help = true;
      continue;
    }

    // --flag=value or --flag value
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg   = arg.substr(0, eq);
    } else if (i + 1 < argc) {
      value = argv[++i];
    } else {
      throw std::invalid_argument("missing value for " + arg);
    }

    if (arg == "--config") {
      cli.config_path = value;
    } else if (arg == "--source-container") {
      cli.overrides.source_container = value;
    } else if (arg == "--destination-bucket") {
      cli.overrides.destination_bucket = value;
    } else if (arg == "--region") {
      cli.overrides.region = value;
    } else if (arg == "--source-uri") {
      cli.overrides.source_uri = value;
    } else if (arg == "--destination-uri") {
      cli.overrides.destination_uri = value;
    } else if (arg == "--max-workers") {
      cli.overrides.max_workers = ParseCount(arg, value);
    } else if (arg == "--bandwidth-limit-mb") {
      cli.overrides.bandwidth_limit_mb = ParseCount(arg, value);
    } else {
      throw std::invalid_argument("unknown option " + arg);
    }
  }

  if (!cli.config_path && !cli.help) {
    const auto& o = cli.overrides;
    if (!o.source_container || !o.destination_bucket || !o.max_workers || !o.region || !o.bandwidth_limit_mb) {
      throw std::invalid_argument(
          "--source-container, --destination-bucket, --max-workers, --region and --bandwidth-limit-mb are required without --config");
    }
  }
  return cli;
}

void Shutdown() {
  try {
    migrator::storage::common::FinalizeFileSystems();
  } catch (const std::exception& e) {
    MIGRATOR_LOG_WARN("Filesystem finalize failed", {StringField("error", e.what())});
  }
  migrator::observability::ShutdownTelemetry();
  migrator::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  migrator::runtime::config::RuntimeConfig config;
  try {
    auto cli = ParseCommandLine(argc, argv);
    if (cli.help) {
      Usage(std::cout);
      return 0;
    }

    if (cli.config_path) {
      config = ConfigLoader::LoadFromYaml(*cli.config_path);
    }
    ConfigLoader::ApplyOverrides(config, cli.overrides);
    ConfigLoader::Validate(config);
  } catch (const std::exception& e) {
    std::cerr << "object-migrator: " << e.what() << "\n\n";
    Usage(std::cerr);
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Logging: console + per-run transfer log
  // ------------------------------------------------------------
  const auto                           started = migrator::util::Now();
  std::optional<std::filesystem::path> log_file;
  if (config.logging().file_enabled()) {
    log_file = std::filesystem::path(config.logging().directory()) /
               migrator::observability::TransferLogFileName(config.source().container(), config.destination().bucket(), started);
  }

  try {
    migrator::observability::InitializeLogging(config, log_file);
  } catch (const std::exception& e) {
    std::cerr << "object-migrator: failed to initialise logging: " << e.what() << "\n";
    return kExitUsage;
  }
  migrator::observability::InitializeTelemetry(config);

  if (log_file) {
    MIGRATOR_LOG_INFO("Transfer log", {StringField("path", log_file->string())});
  }

  // ------------------------------------------------------------
  // Run
  // ------------------------------------------------------------
  int exit_code = kExitFatal;
  try {
    auto app     = migrator::factory::Build(config);
    auto summary = app.engine->Run();
    exit_code    = summary.ExitCode();
  } catch (const migrator::util::DestinationMissing& e) {
    MIGRATOR_LOG_ERROR("Migration aborted", {StringField("error", e.what())});
  } catch (const migrator::util::AuthExpired& e) {
    MIGRATOR_LOG_ERROR("Credentials expired or rejected, refresh them and rerun", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    MIGRATOR_LOG_ERROR("Fatal error", {StringField("error", e.what())});
  }

  Shutdown();
  return exit_code;
}
