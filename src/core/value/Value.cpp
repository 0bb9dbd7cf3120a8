#include "Value.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

const char* const kLabelNames[] = {
  "None", "Gray", "Green", "Purple", "Blue", "Yellow", "Red", "Orange"
};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

const char* to_string(ValueKind kind) {
  switch (kind) {
    case ValueKind::String:       return "string";
    case ValueKind::StringList:   return "list of strings";
    case ValueKind::Integer:      return "integer";
    case ValueKind::Boolean:      return "boolean";
    case ValueKind::DateTime:     return "date/time";
    case ValueKind::DateTimeList: return "list of date/times";
    case ValueKind::TagList:      return "list of tags";
  }
  return "unknown";
}

bool isListKind(ValueKind kind) {
  return kind == ValueKind::StringList || kind == ValueKind::DateTimeList ||
         kind == ValueKind::TagList;
}

// ---------- tags ----------

std::optional<int> reservedColorForName(const std::string& name) {
  const std::string l = lower(name);
  for (int c = 1; c <= kMaxColor; ++c) {
    if (l == lower(kLabelNames[c])) return c;
  }
  return std::nullopt;
}

std::string labelNameForColor(int color) {
  if (color < kColorNone || color > kMaxColor) {
    throw TypeMismatch("color must be in range 0 to 7: " + std::to_string(color));
  }
  return kLabelNames[color];
}

Tag parseTag(const std::string& text) {
  auto comma = text.find(',');
  std::string name = trim(text.substr(0, comma));
  if (name.empty()) throw TypeMismatch("tag name must not be empty: '" + text + "'");

  if (comma == std::string::npos) {
    if (auto c = reservedColorForName(name)) return Tag{kLabelNames[*c], *c};
    return Tag{name, kColorNone};
  }

  std::string rest = text.substr(comma + 1);
  if (rest.find(',') != std::string::npos) {
    throw TypeMismatch("more than one value found after comma: '" + text + "'");
  }
  std::string color = lower(trim(rest));
  for (int c = 0; c <= kMaxColor; ++c) {
    if (color == lower(kLabelNames[c])) return Tag{name, c};
  }
  if (color.size() == 1 && color[0] >= '0' && color[0] <= '7') {
    return Tag{name, color[0] - '0'};
  }
  throw TypeMismatch("color must be in range 0 to 7 or a label name: '" + text + "'");
}

// ---------- Value ----------

Value Value::ofString(std::string s)                    { return Value(Storage(std::move(s))); }
Value Value::ofStringList(std::vector<std::string> v)   { return Value(Storage(std::move(v))); }
Value Value::ofInteger(std::int64_t i)                  { return Value(Storage(i)); }
Value Value::ofBoolean(bool b)                          { return Value(Storage(b)); }
Value Value::ofDateTime(DateTime dt)                    { return Value(Storage(std::move(dt))); }
Value Value::ofDateTimeList(std::vector<DateTime> v)    { return Value(Storage(std::move(v))); }
Value Value::ofTags(std::vector<Tag> v)                 { return Value(Storage(std::move(v))); }

Value Value::emptyOf(ValueKind kind) {
  switch (kind) {
    case ValueKind::StringList:   return ofStringList({});
    case ValueKind::DateTimeList: return ofDateTimeList({});
    case ValueKind::TagList:      return ofTags({});
    default:                      return Value();
  }
}

std::optional<ValueKind> Value::kind() const {
  if (isNull()) return std::nullopt;
  // variant alternatives follow ValueKind order after monostate
  return static_cast<ValueKind>(v_.index() - 1);
}

bool Value::isEmpty() const {
  if (isNull()) return true;
  if (auto* s = std::get_if<std::string>(&v_)) return s->empty();
  if (auto* l = std::get_if<std::vector<std::string>>(&v_)) return l->empty();
  if (auto* d = std::get_if<std::vector<DateTime>>(&v_)) return d->empty();
  if (auto* t = std::get_if<std::vector<Tag>>(&v_)) return t->empty();
  return false;
}

template <typename T>
const T& Value::get(ValueKind expected) const {
  if (auto* p = std::get_if<T>(&v_)) return *p;
  auto k = kind();
  throw TypeMismatch(std::string("expected ") + to_string(expected) + " but value is " +
                     (k ? to_string(*k) : "null"));
}

const std::string& Value::asString() const { return get<std::string>(ValueKind::String); }
const std::vector<std::string>& Value::asStringList() const {
  return get<std::vector<std::string>>(ValueKind::StringList);
}
std::int64_t Value::asInteger() const { return get<std::int64_t>(ValueKind::Integer); }
bool Value::asBoolean() const { return get<bool>(ValueKind::Boolean); }
const DateTime& Value::asDateTime() const { return get<DateTime>(ValueKind::DateTime); }
const std::vector<DateTime>& Value::asDateTimeList() const {
  return get<std::vector<DateTime>>(ValueKind::DateTimeList);
}
const std::vector<Tag>& Value::asTags() const { return get<std::vector<Tag>>(ValueKind::TagList); }

void requireKind(const Value& value, ValueKind kind, const std::string& attribute) {
  auto k = value.kind();
  if (!k || *k == kind) return;
  throw TypeMismatch(attribute + " expects " + to_string(kind) + " but value is " +
                     to_string(*k));
}

std::string describe(const Value& value) {
  auto k = value.kind();
  if (!k) return "null";
  std::string out;
  auto join = [&out](const std::vector<std::string>& parts) {
    out = "[";
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i) out += ", ";
      out += parts[i];
    }
    out += "]";
  };
  switch (*k) {
    case ValueKind::String:     return value.asString();
    case ValueKind::StringList: join(value.asStringList()); return out;
    case ValueKind::Integer:    return std::to_string(value.asInteger());
    case ValueKind::Boolean:    return value.asBoolean() ? "true" : "false";
    case ValueKind::DateTime:   return formatIsoDateTime(value.asDateTime());
    case ValueKind::DateTimeList: {
      std::vector<std::string> parts;
      for (const auto& d : value.asDateTimeList()) parts.push_back(formatIsoDateTime(d));
      join(parts);
      return out;
    }
    case ValueKind::TagList: {
      std::vector<std::string> parts;
      for (const auto& t : value.asTags()) parts.push_back(t.name + ": " + labelNameForColor(t.color));
      join(parts);
      return out;
    }
  }
  return out;
}

} // namespace filemeta
