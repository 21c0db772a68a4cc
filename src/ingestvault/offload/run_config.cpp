#include "ingestvault/offload/run_config.hpp"
#include "ingestvault/utilities/data_dir.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <thread>
#include <yaml-cpp/yaml.h>

namespace ingestvault {

std::string overwritePolicyToString(OverwritePolicy policy) {
  switch (policy) {
  case OverwritePolicy::Fail:
    return "fail";
  case OverwritePolicy::SkipVerified:
    return "skip-verified";
  case OverwritePolicy::Overwrite:
    return "overwrite";
  }
  return "unknown";
}

OverwritePolicy parseOverwritePolicy(const std::string &name) {
  if (name == "fail")
    return OverwritePolicy::Fail;
  if (name == "skip-verified" || name == "skip_verified" || name == "skip")
    return OverwritePolicy::SkipVerified;
  if (name == "overwrite")
    return OverwritePolicy::Overwrite;
  throw std::invalid_argument("Unknown overwrite policy '" + name +
                              "' (expected fail, skip-verified or overwrite)");
}

std::size_t RunConfig::defaultConcurrency() {
  unsigned int hw = std::thread::hardware_concurrency();
  return hw == 0 ? 2 : static_cast<std::size_t>(hw) * 2;
}

static RunConfig fromYamlNode(const YAML::Node &node) {
  RunConfig cfg;
  if (node["source"])
    cfg.sourceRoot = node["source"].as<std::string>();
  if (node["destinations"]) {
    for (const auto &d : node["destinations"])
      cfg.destinationRoots.push_back(d.as<std::string>());
  }
  if (node["algorithm"])
    cfg.algorithm = parseAlgorithm(node["algorithm"].as<std::string>());
  if (node["include"]) {
    for (const auto &p : node["include"])
      cfg.includePatterns.push_back(p.as<std::string>());
  }
  if (node["exclude"]) {
    for (const auto &p : node["exclude"])
      cfg.excludePatterns.push_back(p.as<std::string>());
  }
  if (node["on_existing"])
    cfg.overwritePolicy =
        parseOverwritePolicy(node["on_existing"].as<std::string>());
  if (node["concurrency"])
    cfg.concurrency = node["concurrency"].as<std::size_t>();
  if (node["chunk_size_mib"])
    cfg.chunkSizeBytes = node["chunk_size_mib"].as<std::size_t>() * 1024 * 1024;
  if (node["per_file_timeout_seconds"])
    cfg.perFileTimeout =
        std::chrono::seconds(node["per_file_timeout_seconds"].as<long>());
  if (node["audit_log"])
    cfg.auditLogPath = node["audit_log"].as<std::string>();
  if (node["project_id"])
    cfg.projectId = node["project_id"].as<std::string>();
  if (node["shoot_day"])
    cfg.shootDay = node["shoot_day"].as<std::string>();
  if (node["report"])
    cfg.reportPath = node["report"].as<std::string>();
  return cfg;
}

RunConfig RunConfig::fromYamlFile(const std::string &path) {
  try {
    return fromYamlNode(YAML::LoadFile(path));
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Cannot load run config " + path + ": " +
                             e.what());
  }
}

RunConfig RunConfig::fromYamlString(const std::string &yaml) {
  try {
    return fromYamlNode(YAML::Load(yaml));
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("Cannot parse run config: ") +
                             e.what());
  }
}

void RunConfig::applyEnvironment() {
  if (const char *env = std::getenv("INGESTVAULT_CONCURRENCY")) {
    long n = std::atol(env);
    if (n > 0)
      concurrency = static_cast<std::size_t>(n);
  }
  if (const char *env = std::getenv("INGESTVAULT_ALGORITHM"))
    algorithm = parseAlgorithm(env);
  if (const char *env = std::getenv("INGESTVAULT_AUDIT_LOG"))
    auditLogPath = env;
}

std::string RunConfig::ledgerPath() const {
  return auditLogPath.empty() ? defaultLedgerPath(projectId) : auditLogPath;
}

static std::filesystem::path normalized(const std::string &p) {
  return std::filesystem::absolute(p).lexically_normal();
}

static bool isWithin(const std::filesystem::path &child,
                     const std::filesystem::path &parent) {
  auto rel = child.lexically_relative(parent);
  return !rel.empty() && *rel.begin() != "..";
}

void RunConfig::validate() const {
  if (sourceRoot.empty())
    throw std::invalid_argument("No source root given");
  if (destinationRoots.empty())
    throw std::invalid_argument("At least one destination root is required");
  if (!overwritePolicy)
    throw std::invalid_argument(
        "An overwrite policy (fail, skip-verified or overwrite) must be chosen "
        "explicitly");
  if (chunkSizeBytes == 0)
    throw std::invalid_argument("Chunk size must be greater than zero");
  if (concurrency == 0)
    throw std::invalid_argument("Concurrency must be at least 1");
  if (perFileTimeout.count() < 0)
    throw std::invalid_argument("Per-file timeout cannot be negative");

  auto src = normalized(sourceRoot);
  std::set<std::filesystem::path> seen;
  for (const auto &d : destinationRoots) {
    auto dst = normalized(d);
    if (dst == src || isWithin(dst, src))
      throw std::invalid_argument("Destination " + d +
                                  " is the source or lies inside it");
    if (!seen.insert(dst).second)
      throw std::invalid_argument("Destination " + d + " is listed twice");
  }
}

} // namespace ingestvault
