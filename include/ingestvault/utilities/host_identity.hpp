#ifndef INGESTVAULT_HOST_IDENTITY_HPP
#define INGESTVAULT_HOST_IDENTITY_HPP

#include <string>

namespace ingestvault {

/**
 * @brief Who ran the process and where. Unknown parts read "unknown".
 */
struct HostIdentity {
  std::string user;
  std::string hostname;
  std::string workingDirectory;

  static HostIdentity current();
};

} // namespace ingestvault

#endif // INGESTVAULT_HOST_IDENTITY_HPP
