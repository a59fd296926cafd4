#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

class CommandError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

bool commandExists(const std::string& command);

// Wraps a value in single quotes for /bin/sh.
std::string shellQuote(const std::string& value);

// Runs `cmd` through the shell and returns everything it wrote to stdout.
// Throws CommandError if the pipe cannot be opened or the exit status is non-zero.
std::string runCommand(const std::string& cmd);

// Private directory under the system temp dir, removed with its contents on
// destruction.
class TempDirectory {
public:
  TempDirectory();
  ~TempDirectory();
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};
