#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/value/DateTime.hpp"

namespace filemeta {

enum class ValueKind {
  String,
  StringList,
  Integer,
  Boolean,
  DateTime,
  DateTimeList,
  TagList
};

const char* to_string(ValueKind kind);
bool isListKind(ValueKind kind);

// Finder label colors.
constexpr int kColorNone = 0;
constexpr int kMaxColor  = 7;

struct Tag {
  std::string name;
  int color = kColorNone;

  bool operator==(const Tag& o) const { return name == o.name && color == o.color; }
  bool operator!=(const Tag& o) const { return !(*this == o); }
};

// Color of a reserved label name (Gray..Orange), matched case-insensitively.
// "None" is not a reserved tag name.
std::optional<int> reservedColorForName(const std::string& name);

// "None", "Gray", ... "Orange". Throws TypeMismatch outside [0,7].
std::string labelNameForColor(int color);

// Parses "name" or "name,color"; color is 0-7 or a label name.
// A bare reserved name becomes the canonical label with its color.
Tag parseTag(const std::string& text);

// Canonical value of one attribute. Null stands for "absent scalar".
class Value {
public:
  Value() = default;

  static Value ofString(std::string s);
  static Value ofStringList(std::vector<std::string> v);
  static Value ofInteger(std::int64_t i);
  static Value ofBoolean(bool b);
  static Value ofDateTime(DateTime dt);
  static Value ofDateTimeList(std::vector<DateTime> v);
  static Value ofTags(std::vector<Tag> v);

  // Empty list for list kinds, null otherwise.
  static Value emptyOf(ValueKind kind);

  bool isNull() const { return v_.index() == 0; }
  std::optional<ValueKind> kind() const;

  // Null, empty string and empty list all count as empty.
  bool isEmpty() const;

  // Accessors throw TypeMismatch when the value holds another kind.
  const std::string& asString() const;
  const std::vector<std::string>& asStringList() const;
  std::int64_t asInteger() const;
  bool asBoolean() const;
  const DateTime& asDateTime() const;
  const std::vector<DateTime>& asDateTimeList() const;
  const std::vector<Tag>& asTags() const;

  bool operator==(const Value& o) const { return v_ == o.v_; }
  bool operator!=(const Value& o) const { return !(v_ == o.v_); }

private:
  using Storage = std::variant<std::monostate,
                               std::string,
                               std::vector<std::string>,
                               std::int64_t,
                               bool,
                               DateTime,
                               std::vector<DateTime>,
                               std::vector<Tag>>;

  explicit Value(Storage v) : v_(std::move(v)) {}

  template <typename T>
  const T& get(ValueKind expected) const;

  Storage v_;
};

// Throws TypeMismatch unless value is null or holds `kind`.
void requireKind(const Value& value, ValueKind kind, const std::string& attribute);

// Short human-readable rendering for logs and the dump command.
std::string describe(const Value& value);

} // namespace filemeta
