#include "OsascriptRunner.hpp"

#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

// Removes the script file when the call returns.
class TempScript {
public:
  explicit TempScript(const std::string& text) {
    std::string tmpl = (std::filesystem::temp_directory_path() / "filemeta-XXXXXX").string();
    int fd = ::mkstemp(&tmpl[0]);
    if (fd < 0) {
      throw AutomationUnavailable(std::string("cannot create script file: ") + std::strerror(errno));
    }
    path_ = tmpl;
    size_t off = 0;
    while (off < text.size()) {
      ssize_t n = ::write(fd, text.data() + off, text.size() - off);
      if (n < 0) {
        int err = errno;
        ::close(fd);
        ::unlink(path_.c_str());
        throw AutomationUnavailable(std::string("cannot write script file: ") + std::strerror(err));
      }
      off += static_cast<size_t>(n);
    }
    ::close(fd);
  }
  ~TempScript() { ::unlink(path_.c_str()); }

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

} // namespace

std::string OsascriptRunner::runScript(const std::string& scriptText) {
  TempScript script(scriptText);
  const std::string cmd = shell_quote(binary_) + " " + shell_quote(script.path()) + " 2>&1";

  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) {
    throw AutomationUnavailable(std::string("cannot start ") + binary_ + ": " + std::strerror(errno));
  }
  std::string output;
  char buf[512];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) output.append(buf, n);
  int status = ::pclose(pipe);

  if (status == -1) {
    throw AutomationUnavailable(std::string("waiting for ") + binary_ + " failed: " + std::strerror(errno));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    spdlog::debug("{} exited with {}: {}", binary_, code, output);
    // 127: the shell could not find the binary (no automation host)
    throw AutomationUnavailable(binary_ + " exited with status " + std::to_string(code) +
                                (output.empty() ? std::string() : ": " + output));
  }
  return output;
}

} // namespace filemeta
