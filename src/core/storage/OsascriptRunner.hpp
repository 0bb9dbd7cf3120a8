#pragma once
#include <string>

#include "core/storage/Primitives.hpp"

namespace filemeta {

// Runs AppleScript text through the osascript binary.
class OsascriptRunner : public ScriptRunner {
public:
  explicit OsascriptRunner(std::string binary = "osascript") : binary_(std::move(binary)) {}
  std::string runScript(const std::string& scriptText) override;

private:
  std::string binary_;
};

} // namespace filemeta
