#ifndef MODEMSTAT_CORE_JSON_UTILS_HPP_
#define MODEMSTAT_CORE_JSON_UTILS_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace modemstat::core {

// Shared JSON string escaping for snapshot, poll-result and table output.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Appends `"key":value` members to one JSON object in call order. Callers
// choose the order, which keeps emitted documents stable across runs.
class JsonObjectBuilder {
public:
  JsonObjectBuilder& AddString(std::string_view key, std::string_view value) {
    return AddRaw(key, QuoteJson(value));
  }

  JsonObjectBuilder& AddInteger(std::string_view key, std::int64_t value) {
    return AddRaw(key, std::to_string(value));
  }

  JsonObjectBuilder& AddUnsigned(std::string_view key, std::uint64_t value) {
    return AddRaw(key, std::to_string(value));
  }

  JsonObjectBuilder& AddBool(std::string_view key, bool value) {
    return AddRaw(key, value ? "true" : "false");
  }

  JsonObjectBuilder& AddNull(std::string_view key) {
    return AddRaw(key, "null");
  }

  // `json` must already be a serialized JSON value.
  JsonObjectBuilder& AddRaw(std::string_view key, std::string_view json) {
    if (!first_) {
      body_ << ',';
    }
    first_ = false;
    body_ << QuoteJson(key) << ':' << json;
    return *this;
  }

  std::string Build() const {
    return "{" + body_.str() + "}";
  }

private:
  std::ostringstream body_;
  bool first_ = true;
};

} // namespace modemstat::core

#endif // MODEMSTAT_CORE_JSON_UTILS_HPP_
