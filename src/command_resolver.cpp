#include "command_resolver.hpp"

#include <unistd.h>

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <utility>

#include "errors.hpp"

namespace {

bool is_executable_file(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

CommandResolver::CommandResolver() {
  const char* env = std::getenv("PATH");
  search_path_ = env ? env : "/usr/local/bin:/usr/bin:/bin";
}

CommandResolver::CommandResolver(std::string search_path) : search_path_(std::move(search_path)) {}

std::vector<std::string> CommandResolver::candidates(const std::string& action) {
  return {"rpicam-" + action, "libcamera-" + action};
}

std::filesystem::path CommandResolver::find_program(const std::string& name) const {
  if (name.find('/') != std::string::npos) {
    return is_executable_file(name) ? std::filesystem::path(name) : std::filesystem::path{};
  }
  std::stringstream ss(search_path_);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) continue;
    std::filesystem::path candidate = std::filesystem::path(dir) / name;
    if (is_executable_file(candidate)) return candidate;
  }
  return {};
}

std::filesystem::path CommandResolver::resolve(const std::string& action) const {
  for (const auto& name : candidates(action)) {
    auto found = find_program(name);
    if (!found.empty()) return found;
  }
  throw CommandNotFoundError(action);
}
