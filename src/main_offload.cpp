#include "ingestvault/audit/audit_ledger.hpp"
#include "ingestvault/audit/ledger_verifier.hpp"
#include "ingestvault/offload/offload_scheduler.hpp"
#include "ingestvault/offload/run_config.hpp"
#include "ingestvault/report/ingestion_report.hpp"
#include "ingestvault/utilities/data_dir.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "ingestvault/utilities/logger.h"
#include "ingestvault/utilities/metrics.h"
#include "ingestvault/utilities/storage.hpp"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace ingestvault;

static constexpr int EXIT_SAFE = 0;
static constexpr int EXIT_ERROR = 1;
static constexpr int EXIT_DO_NOT_FORMAT = 2;
static constexpr int EXIT_LEDGER_TAMPERED = 3;

static OffloadScheduler *g_scheduler = nullptr;

static void handleSignal(int) {
  if (g_scheduler)
    g_scheduler->cancel();
}

/// Routes SIGINT/SIGTERM to scheduler cancellation while in scope.
class SignalRelay {
public:
  explicit SignalRelay(OffloadScheduler &scheduler) {
    g_scheduler = &scheduler;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
  }
  ~SignalRelay() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_scheduler = nullptr;
  }
};

static void usage(const char *prog) {
  std::cerr
      << "Usage: " << prog
      << " offload --source S --dest D [--dest D2 ...] --on-existing "
         "{fail|skip-verified|overwrite}\n"
         "           [--algorithm sha256|md5] [--include G]... [--exclude "
         "G]... [--jobs N]\n"
         "           [--chunk-mib N] [--timeout SECS] [--audit-log P] "
         "[--project ID]\n"
         "           [--shoot-day D] [--report P] [--metrics-out P] "
         "[--config YAML] [--log-file P]\n"
      << "       " << prog << " verify-ledger <ledger>\n"
      << "       " << prog << " export-ledger <ledger> <out.json|out.txt>\n";
}

/**
 * Prints one line per status change; workers call it concurrently.
 */
class ConsoleProgress : public TransferObserver {
public:
  void onTransferUpdate(const TransferRecord &record) override {
    if (!record.terminal())
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << transferStatusToString(record.status()) << "] "
              << record.source().relativePath << " -> "
              << record.destination().root << std::endl;
  }

private:
  std::mutex mutex_;
};

static std::size_t parseCount(const std::string &flag, const std::string &value) {
  std::size_t pos = 0;
  unsigned long n = std::stoul(value, &pos);
  if (pos != value.size())
    throw std::invalid_argument(flag + " expects a number, got " + value);
  return static_cast<std::size_t>(n);
}

static int offloadCommand(int argc, char *argv[]) {
  RunConfig cfg;
  std::string configFile;
  std::string metricsOut;
  std::string logFile = logsDir() + "/ingestvault.log";

  // The YAML file is the base layer; flags override it wherever given.
  for (int i = 2; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config")
      configFile = argv[i + 1];
  }
  if (!configFile.empty())
    cfg = RunConfig::fromYamlFile(configFile);
  cfg.applyEnvironment();

  bool destinationsFromFlags = false;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (i + 1 >= argc) {
      throw std::invalid_argument("Missing value for " + arg);
    }
    std::string value = argv[++i];
    if (arg == "--source") {
      cfg.sourceRoot = value;
    } else if (arg == "--dest") {
      if (!destinationsFromFlags) {
        cfg.destinationRoots.clear();
        destinationsFromFlags = true;
      }
      cfg.destinationRoots.push_back(value);
    } else if (arg == "--on-existing") {
      cfg.overwritePolicy = parseOverwritePolicy(value);
    } else if (arg == "--algorithm") {
      cfg.algorithm = parseAlgorithm(value);
    } else if (arg == "--include") {
      cfg.includePatterns.push_back(value);
    } else if (arg == "--exclude") {
      cfg.excludePatterns.push_back(value);
    } else if (arg == "--jobs") {
      cfg.concurrency = parseCount(arg, value);
    } else if (arg == "--chunk-mib") {
      cfg.chunkSizeBytes = parseCount(arg, value) * 1024 * 1024;
    } else if (arg == "--timeout") {
      cfg.perFileTimeout = std::chrono::seconds(parseCount(arg, value));
    } else if (arg == "--audit-log") {
      cfg.auditLogPath = value;
    } else if (arg == "--project") {
      cfg.projectId = value;
    } else if (arg == "--shoot-day") {
      cfg.shootDay = value;
    } else if (arg == "--report") {
      cfg.reportPath = value;
    } else if (arg == "--metrics-out") {
      metricsOut = value;
    } else if (arg == "--log-file") {
      logFile = value;
    } else if (arg != "--config") {
      throw std::invalid_argument("Unknown option " + arg);
    }
  }

  if (logFile != Logger::CONSOLE_ONLY_OUTPUT) {
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(logFile).parent_path(), ec);
  }
  Logger::init(logFile, LogLevel::INFO);
  cfg.validate();

  AuditLedger ledger(cfg.ledgerPath());
  if (ledger.openStatus() == LedgerOpenStatus::Reset)
    std::cerr << "WARNING: " << ledger.openNotice() << std::endl;

  // A transfer abandoned after a stall may still be using it after run().
  static LocalStorage storage;
  ConsoleProgress progress;
  OffloadScheduler scheduler(cfg, ledger, storage, &progress);
  IngestionReport report;
  {
    SignalRelay relay(scheduler);
    report = scheduler.run();
  }
  ledger.stop();

  std::cout << "\n" << report.renderSummary();
  if (!cfg.reportPath.empty()) {
    report.save(cfg.reportPath);
    std::cout << "Report written to " << cfg.reportPath << std::endl;
  }
  if (!metricsOut.empty()) {
    std::ofstream out(metricsOut, std::ios::trunc);
    if (!out.is_open())
      throw std::runtime_error("Cannot write metrics to " + metricsOut);
    out << MetricsRegistry::instance().toPrometheus();
  }
  return report.safeToFormat() ? EXIT_SAFE : EXIT_DO_NOT_FORMAT;
}

static int verifyLedgerCommand(const std::string &path) {
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  LedgerVerifyResult result = verifyLedgerFile(path);
  if (result.intact) {
    std::cout << "Ledger intact: " << result.entriesChecked << " entries"
              << std::endl;
    return EXIT_SAFE;
  }
  std::cout << "Ledger TAMPERED: first divergence at sequence "
            << *result.firstDivergence << " (" << result.detail << ")"
            << std::endl;
  return EXIT_LEDGER_TAMPERED;
}

static int exportLedgerCommand(const std::string &path, const std::string &out) {
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  auto entries = AuditLedger::loadFile(path);
  std::ofstream file(out, std::ios::trunc);
  if (!file.is_open())
    throw std::runtime_error("Cannot write " + out);
  if (std::filesystem::path(out).extension() == ".json")
    file << AuditLedger::exportEntries(entries).dump(2) << "\n";
  else
    file << AuditLedger::renderCustodyReport(entries);
  if (!file)
    throw std::runtime_error("Failed writing " + out);
  std::cout << "Exported " << entries.size() << " entries to " << out
            << std::endl;
  return EXIT_SAFE;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    usage(argv[0]);
    return EXIT_ERROR;
  }
  std::string cmd = argv[1];
  try {
    if (cmd == "offload")
      return offloadCommand(argc, argv);
    if (cmd == "verify-ledger" && argc == 3)
      return verifyLedgerCommand(argv[2]);
    if (cmd == "export-ledger" && argc == 4)
      return exportLedgerCommand(argv[2], argv[3]);
  } catch (const OffloadException &e) {
    std::cerr << "ERROR (" << errorKindToString(e.kind()) << "): " << e.what()
              << std::endl;
    return EXIT_ERROR;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_ERROR;
  }
  usage(argv[0]);
  return EXIT_ERROR;
}
