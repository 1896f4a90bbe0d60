#include "json_fields.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace sparkscope::decode::json {

const Value* Find(const Object& obj, std::string_view key) {
  const auto& fields = obj.fields();
  auto        it     = fields.find(std::string(key));
  if (it == fields.end()) {
    return nullptr;
  }
  if (it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

const Object* FindObject(const Object& obj, std::string_view key) {
  const auto* value = Find(obj, key);
  if (!value || value->kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

std::optional<std::string> GetString(const Object& obj, std::string_view key) {
  const auto* value = Find(obj, key);
  if (!value || value->kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return value->string_value();
}

std::optional<std::uint64_t> ToUInt(const Value& value) {
  if (value.kind_case() == Value::kNumberValue) {
    const double number = value.number_value();
    if (!std::isfinite(number) || number < 0.0 || number != std::floor(number) ||
        number >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(number);
  }

  // Some producers stringify large counters.
  if (value.kind_case() == Value::kStringValue) {
    const auto&   text   = value.string_value();
    std::uint64_t parsed = 0;
    auto [ptr, ec]       = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
      return parsed;
    }
  }
  return std::nullopt;
}

std::optional<std::uint64_t> GetUInt(const Object& obj, std::string_view key) {
  const auto* value = Find(obj, key);
  if (!value) {
    return std::nullopt;
  }
  return ToUInt(*value);
}

std::optional<std::uint64_t> GetUIntAny(const Object& obj, std::initializer_list<std::string_view> keys) {
  for (const auto key : keys) {
    if (auto value = GetUInt(obj, key)) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<bool> GetBool(const Object& obj, std::string_view key) {
  const auto* value = Find(obj, key);
  if (!value || value->kind_case() != Value::kBoolValue) {
    return std::nullopt;
  }
  return value->bool_value();
}

std::optional<util::TimePoint> GetTimestamp(const Object& obj, std::string_view key) {
  auto ms = GetUInt(obj, key);
  // Spark reports 0 for "not yet happened" on several timestamps.
  if (!ms || *ms == 0) {
    return std::nullopt;
  }
  // Beyond the clock's range the instant is unrepresentable; treat as unreported.
  if (*ms > static_cast<std::uint64_t>(util::kMaxUnixMillis)) {
    return std::nullopt;
  }
  return util::FromUnixMillis(static_cast<std::int64_t>(*ms));
}

std::vector<std::uint64_t> GetUIntList(const Object& obj, std::string_view key) {
  std::vector<std::uint64_t> out;

  const auto* value = Find(obj, key);
  if (!value || value->kind_case() != Value::kListValue) {
    return out;
  }

  for (const auto& item : value->list_value().values()) {
    if (auto number = ToUInt(item)) {
      out.push_back(*number);
    }
  }
  return out;
}

std::size_t ArraySize(const Object& obj, std::string_view key) {
  const auto* value = Find(obj, key);
  if (!value || value->kind_case() != Value::kListValue) {
    return 0;
  }
  return static_cast<std::size_t>(value->list_value().values_size());
}

} // namespace sparkscope::decode::json
