#include "ingestvault/utilities/data_dir.hpp"

#include <cstdlib>

namespace ingestvault {

static std::string dataDirPath = [] {
  const char *env = std::getenv("INGESTVAULT_HOME");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0')
    return std::string(home) + "/.ingestvault";
  return std::string(".ingestvault");
}();

void setDataDir(const std::string &dir) { dataDirPath = dir; }

const std::string &dataDir() { return dataDirPath; }

std::string logsDir() { return dataDir() + "/logs"; }

std::string auditDir() { return dataDir() + "/audit"; }

std::string defaultLedgerPath(const std::string &projectId) {
  if (projectId.empty())
    return auditDir() + "/audit_global.jsonl";
  return auditDir() + "/audit_" + projectId + ".jsonl";
}

} // namespace ingestvault
