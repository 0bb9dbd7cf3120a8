#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace filemeta {

// Base for every failure the metadata layer reports.
class MetadataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class AttributeNotSupported : public MetadataError {
public:
  explicit AttributeNotSupported(const std::string& name)
    : MetadataError("attribute not supported: " + name), name_(name) {}
  const std::string& name() const { return name_; }
private:
  std::string name_;
};

class TypeMismatch : public MetadataError {
public:
  using MetadataError::MetadataError;
};

class ValueNotFound : public MetadataError {
public:
  using MetadataError::MetadataError;
};

class BinaryDecodeError : public MetadataError {
public:
  using MetadataError::MetadataError;
};

class AutomationUnavailable : public MetadataError {
public:
  using MetadataError::MetadataError;
};

class ReadOnlyAttribute : public MetadataError {
public:
  using MetadataError::MetadataError;
};

// errno or SQLite failure inside a storage primitive.
class StorageError : public MetadataError {
public:
  using MetadataError::MetadataError;
};

struct BindingFailure {
  std::string binding;  // e.g. "CommentChannel:kMDItemFinderComment"
  std::string message;
};

// Raised when a write fanned out to several bindings and at least one failed.
// Writes that succeeded are not rolled back.
class PartialWriteFailure : public MetadataError {
public:
  PartialWriteFailure(const std::string& attribute,
                      std::vector<std::string> succeeded,
                      std::vector<BindingFailure> failed)
    : MetadataError(describe(attribute, succeeded, failed)),
      attribute_(attribute),
      succeeded_(std::move(succeeded)),
      failed_(std::move(failed)) {}

  const std::string& attribute() const { return attribute_; }
  const std::vector<std::string>& succeeded() const { return succeeded_; }
  const std::vector<BindingFailure>& failed() const { return failed_; }

private:
  static std::string describe(const std::string& attribute,
                              const std::vector<std::string>& succeeded,
                              const std::vector<BindingFailure>& failed) {
    std::string msg = "partial write of " + attribute + ": ";
    msg += std::to_string(succeeded.size()) + " succeeded";
    for (const auto& s : succeeded) msg += " [" + s + "]";
    msg += ", " + std::to_string(failed.size()) + " failed";
    for (const auto& f : failed) msg += " [" + f.binding + ": " + f.message + "]";
    return msg;
  }

  std::string attribute_;
  std::vector<std::string> succeeded_;
  std::vector<BindingFailure> failed_;
};

} // namespace filemeta
