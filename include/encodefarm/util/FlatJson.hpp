// Repository: Encodefarm
// Component: Flat JSON helpers
// Purpose: Minimal writer/reader for flat JSON objects (encode config column,
//          event payloads). Nested values are not supported.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_UTIL_FLAT_JSON_HPP_
#define ENCODEFARM_UTIL_FLAT_JSON_HPP_

#include <cstdint>
#include <map>
#include <sstream>
#include <string>

namespace encodefarm::util {

std::string JsonEscape(const std::string& s);

// {"k":"v",...} with every value written as a JSON string.
std::string EncodeFlatObject(const std::map<std::string, std::string>& values);

// Parses a flat object whose values are strings, numbers, booleans or null.
// Non-string scalars are returned in their literal text form; null values
// are skipped. Returns false on malformed input and leaves *out untouched.
bool DecodeFlatObject(const std::string& json, std::map<std::string, std::string>* out);

// Builds one flat JSON object field by field.
class JsonObjectWriter {
 public:
  JsonObjectWriter& Add(const std::string& key, const std::string& value);
  JsonObjectWriter& Add(const std::string& key, const char* value);
  JsonObjectWriter& Add(const std::string& key, int64_t value);
  JsonObjectWriter& Add(const std::string& key, int value);
  JsonObjectWriter& Add(const std::string& key, double value);
  JsonObjectWriter& Add(const std::string& key, bool value);
  JsonObjectWriter& AddNull(const std::string& key);

  std::string Str() const;

 private:
  void Key(const std::string& key);

  std::ostringstream body_;
  bool first_ = true;
};

}  // namespace encodefarm::util

#endif  // ENCODEFARM_UTIL_FLAT_JSON_HPP_
