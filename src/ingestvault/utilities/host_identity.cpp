#include "ingestvault/utilities/host_identity.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace ingestvault {

namespace {

std::string effectiveUser() {
  struct passwd pw;
  struct passwd *result = nullptr;
  std::vector<char> buf(16384);
  if (::getpwuid_r(::geteuid(), &pw, buf.data(), buf.size(), &result) == 0 &&
      result != nullptr && result->pw_name != nullptr)
    return result->pw_name;
  // Containers often run with a uid that has no passwd entry.
  const char *env = std::getenv("USER");
  if (env && env[0] != '\0')
    return env;
  return "unknown";
}

std::string hostName() {
  std::array<char, 256> buffer{};
  if (::gethostname(buffer.data(), buffer.size()) == 0) {
    buffer.back() = '\0';
    return std::string(buffer.data());
  }
  return "unknown";
}

} // namespace

HostIdentity HostIdentity::current() {
  HostIdentity id;
  id.user = effectiveUser();
  id.hostname = hostName();
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  id.workingDirectory = ec ? std::string("unknown") : cwd.string();
  return id;
}

} // namespace ingestvault
