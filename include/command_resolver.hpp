#pragma once
#include <filesystem>
#include <string>
#include <vector>

// Maps a logical camera action ("still", "hello") onto an installed binary. The rpicam-*
// name is preferred over the legacy libcamera-* name.
class CommandResolver {
public:
  // Uses $PATH.
  CommandResolver();
  // Uses a colon-separated search path instead of $PATH.
  explicit CommandResolver(std::string search_path);

  // Throws CommandNotFoundError when no candidate is installed.
  std::filesystem::path resolve(const std::string& action) const;

  // Looks up a plain program name (e.g. "ffmpeg"). Empty path when missing.
  std::filesystem::path find_program(const std::string& name) const;

  static std::vector<std::string> candidates(const std::string& action);
  const std::string& search_path() const { return search_path_; }

private:
  std::string search_path_;
};
