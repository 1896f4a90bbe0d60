#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace sparkscope::decode::json {

/*
  Typed accessors over a parsed JSON object.

  Every accessor returns nullopt (or an empty list) when the key is absent
  or holds a value of the wrong shape.
*/

using Object = google::protobuf::Struct;
using Value  = google::protobuf::Value;

const Value*  Find(const Object& obj, std::string_view key);
const Object* FindObject(const Object& obj, std::string_view key);

std::optional<std::string>   GetString(const Object& obj, std::string_view key);
std::optional<std::uint64_t> GetUInt(const Object& obj, std::string_view key);
std::optional<bool>          GetBool(const Object& obj, std::string_view key);
std::optional<util::TimePoint> GetTimestamp(const Object& obj, std::string_view key);

// Array of non-negative integers; non-integer entries are dropped.
std::vector<std::uint64_t> GetUIntList(const Object& obj, std::string_view key);

// Number of entries when the key holds an array, 0 otherwise.
std::size_t ArraySize(const Object& obj, std::string_view key);

// First key present wins.
std::optional<std::uint64_t> GetUIntAny(const Object& obj, std::initializer_list<std::string_view> keys);

std::optional<std::uint64_t> ToUInt(const Value& value);

} // namespace sparkscope::decode::json
