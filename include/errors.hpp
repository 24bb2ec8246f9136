#pragma once
#include <stdexcept>
#include <string>

// Neither a modern nor a legacy binary exists for a camera action.
class CommandNotFoundError : public std::runtime_error {
public:
  explicit CommandNotFoundError(const std::string& action)
      : std::runtime_error("No camera command found for '" + action + "'"), action_(action) {}
  const std::string& action() const { return action_; }

private:
  std::string action_;
};

// Invalid run parameters or unreadable configuration. Raised before anything touches disk.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A single capture failed. Only used inside the capture path; the scheduler turns it into a
// logged failure outcome.
class CaptureFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Video assembly failed. Does not affect acquisition.
class EncodingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
