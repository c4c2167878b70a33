// Repository: Encodefarm
// Component: Flat JSON helpers
// Copyright (c) 2025 RetroVue

#include "encodefarm/util/FlatJson.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace encodefarm::util {

namespace {

void SkipSpace(const std::string& s, size_t* i) {
  while (*i < s.size() && std::isspace(static_cast<unsigned char>(s[*i]))) ++*i;
}

bool ParseString(const std::string& s, size_t* i, std::string* out) {
  if (*i >= s.size() || s[*i] != '"') return false;
  ++*i;
  out->clear();
  while (*i < s.size()) {
    char c = s[*i];
    if (c == '"') {
      ++*i;
      return true;
    }
    if (c == '\\') {
      if (*i + 1 >= s.size()) return false;
      char e = s[*i + 1];
      switch (e) {
        case '"': *out += '"'; break;
        case '\\': *out += '\\'; break;
        case '/': *out += '/'; break;
        case 'n': *out += '\n'; break;
        case 'r': *out += '\r'; break;
        case 't': *out += '\t'; break;
        case 'b': *out += '\b'; break;
        case 'f': *out += '\f'; break;
        case 'u': {
          if (*i + 5 >= s.size()) return false;
          unsigned code = 0;
          if (std::sscanf(s.c_str() + *i + 2, "%4x", &code) != 1) return false;
          // Control characters only; the writer never emits other escapes.
          if (code < 0x80) {
            *out += static_cast<char>(code);
          } else {
            *out += '?';
          }
          *i += 4;
          break;
        }
        default:
          return false;
      }
      *i += 2;
      continue;
    }
    *out += c;
    ++*i;
  }
  return false;
}

// Bare scalar: number, true, false. Returns false for null (caller skips).
bool ParseBareScalar(const std::string& s, size_t* i, std::string* out, bool* is_null) {
  size_t start = *i;
  while (*i < s.size() && s[*i] != ',' && s[*i] != '}' &&
         !std::isspace(static_cast<unsigned char>(s[*i]))) {
    ++*i;
  }
  if (*i == start) return false;
  *out = s.substr(start, *i - start);
  *is_null = (*out == "null");
  return true;
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

std::string EncodeFlatObject(const std::map<std::string, std::string>& values) {
  JsonObjectWriter w;
  for (const auto& [key, value] : values) {
    w.Add(key, value);
  }
  return w.Str();
}

bool DecodeFlatObject(const std::string& json, std::map<std::string, std::string>* out) {
  std::map<std::string, std::string> result;
  size_t i = 0;
  SkipSpace(json, &i);
  if (i >= json.size() || json[i] != '{') return false;
  ++i;
  SkipSpace(json, &i);
  if (i < json.size() && json[i] == '}') {
    *out = std::move(result);
    return true;
  }
  while (i < json.size()) {
    std::string key;
    SkipSpace(json, &i);
    if (!ParseString(json, &i, &key)) return false;
    SkipSpace(json, &i);
    if (i >= json.size() || json[i] != ':') return false;
    ++i;
    SkipSpace(json, &i);
    std::string value;
    bool is_null = false;
    if (i < json.size() && json[i] == '"') {
      if (!ParseString(json, &i, &value)) return false;
    } else if (!ParseBareScalar(json, &i, &value, &is_null)) {
      return false;
    }
    if (!is_null) result[key] = value;
    SkipSpace(json, &i);
    if (i >= json.size()) return false;
    if (json[i] == ',') {
      ++i;
      continue;
    }
    if (json[i] == '}') {
      *out = std::move(result);
      return true;
    }
    return false;
  }
  return false;
}

// ---------------------------------------------------------------------------
// JsonObjectWriter
// ---------------------------------------------------------------------------

void JsonObjectWriter::Key(const std::string& key) {
  if (!first_) body_ << ',';
  first_ = false;
  body_ << '"' << JsonEscape(key) << "\":";
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const std::string& value) {
  Key(key);
  body_ << '"' << JsonEscape(value) << '"';
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, const char* value) {
  return Add(key, std::string(value ? value : ""));
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, int64_t value) {
  Key(key);
  body_ << value;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, int value) {
  return Add(key, static_cast<int64_t>(value));
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, double value) {
  Key(key);
  if (!std::isfinite(value)) {
    body_ << "null";
    return *this;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  body_ << buf;
  return *this;
}

JsonObjectWriter& JsonObjectWriter::Add(const std::string& key, bool value) {
  Key(key);
  body_ << (value ? "true" : "false");
  return *this;
}

JsonObjectWriter& JsonObjectWriter::AddNull(const std::string& key) {
  Key(key);
  body_ << "null";
  return *this;
}

std::string JsonObjectWriter::Str() const {
  return "{" + body_.str() + "}";
}

}  // namespace encodefarm::util
