#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/errors/Errors.hpp"
#include "core/storage/BackendAdapters.hpp"
#include "core/storage/Primitives.hpp"

namespace filemeta::test {

class InMemoryXattr : public XattrPrimitive {
public:
  std::optional<Bytes> read(const std::string& path, const std::string& key) override {
    auto it = data_.find({path, key});
    if (it == data_.end()) return std::nullopt;
    return it->second;
  }
  void write(const std::string& path, const std::string& key, const Bytes& value) override {
    ++writes;
    data_[{path, key}] = value;
  }
  void remove(const std::string& path, const std::string& key) override {
    data_.erase({path, key});
  }
  std::vector<std::string> list(const std::string& path) override {
    std::vector<std::string> keys;
    for (const auto& kv : data_) if (kv.first.first == path) keys.push_back(kv.first.second);
    return keys;
  }

  bool has(const std::string& path, const std::string& key) const {
    return data_.count({path, key}) != 0;
  }

  int writes = 0;

private:
  std::map<std::pair<std::string, std::string>, Bytes> data_;
};

class InMemoryItems : public ItemValueSource {
public:
  std::optional<nlohmann::json> copyItemValue(const std::string& path,
                                              const std::string& key) override {
    auto it = data_.find({path, key});
    if (it == data_.end()) return std::nullopt;
    return it->second;
  }
  void put(const std::string& path, const std::string& key, nlohmann::json value) {
    if (value.is_null()) data_.erase({path, key});
    else data_[{path, key}] = std::move(value);
  }

private:
  std::map<std::pair<std::string, std::string>, nlohmann::json> data_;
};

class InMemoryResources : public ResourceValueStore {
public:
  std::optional<nlohmann::json> getResourceValue(const std::string& path,
                                                 const std::string& key) override {
    auto it = data_.find({path, key});
    if (it == data_.end()) return std::nullopt;
    return it->second;
  }
  void setResourceValue(const std::string& path, const std::string& key,
                        const nlohmann::json& value) override {
    if (value.is_null()) data_.erase({path, key});
    else data_[{path, key}] = value;
  }

private:
  std::map<std::pair<std::string, std::string>, nlohmann::json> data_;
};

// Records every script; `available=false` simulates a missing automation host.
class FakeScriptRunner : public ScriptRunner {
public:
  std::string runScript(const std::string& scriptText) override {
    if (!available) throw AutomationUnavailable("Finder is not reachable");
    scripts.push_back(scriptText);
    if (onRun) onRun(scriptText);
    return {};
  }

  bool available = true;
  std::vector<std::string> scripts;
  std::function<void(const std::string&)> onRun;
};

struct FakeWorld {
  std::shared_ptr<InMemoryXattr>     xattr = std::make_shared<InMemoryXattr>();
  std::shared_ptr<InMemoryItems>     items = std::make_shared<InMemoryItems>();
  std::shared_ptr<InMemoryResources> resources = std::make_shared<InMemoryResources>();
  std::shared_ptr<FakeScriptRunner>  scripts = std::make_shared<FakeScriptRunner>();

  Collaborators collaborators() const {
    Collaborators c;
    c.xattr = xattr;
    c.items = items;
    c.resources = resources;
    c.scripts = scripts;
    return c;
  }
};

} // namespace filemeta::test
