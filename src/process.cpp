#include "process.hpp"

#include <cstdio>
#include <cstdlib>
#include <system_error>
#include <vector>

#include <stdlib.h>

#include <spdlog/spdlog.h>

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string shellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted += ch;
    }
  }
  quoted += "'";
  return quoted;
}

std::string runCommand(const std::string& cmd) {
  spdlog::debug("running: {}", cmd);
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw CommandError("Failed to open pipe for: " + cmd);
  }

  std::string output;
  char buffer[8192];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, n);
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw CommandError("Command returned non-zero exit code " + std::to_string(rc) + ": " + cmd);
  }
  return output;
}

TempDirectory::TempDirectory() {
  std::string pattern = (std::filesystem::temp_directory_path() / "billextract-XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error("Failed to create temporary directory from " + pattern);
  }
  path_ = buf.data();
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    spdlog::warn("could not remove temporary directory {}: {}", path_.string(), ec.message());
  }
}
