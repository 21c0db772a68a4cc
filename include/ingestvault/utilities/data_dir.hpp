#ifndef INGESTVAULT_DATA_DIR_HPP
#define INGESTVAULT_DATA_DIR_HPP

#include <string>

namespace ingestvault {

void setDataDir(const std::string &dir);
/** INGESTVAULT_HOME, else $HOME/.ingestvault, else .ingestvault. */
const std::string &dataDir();

std::string logsDir();
std::string auditDir();

/**
 * @brief Default ledger location when the run does not name one.
 * @param projectId Empty for the global ledger.
 */
std::string defaultLedgerPath(const std::string &projectId = "");

} // namespace ingestvault

#endif // INGESTVAULT_DATA_DIR_HPP
