#include "parsers/json_payload_parser.hpp"

#include "core/json_dom.hpp"
#include "parsers/html_status_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace modemstat::parsers {

namespace {

using JsonValue = core::json::Value;

std::optional<std::string> ScalarText(const JsonValue& value) {
  switch (value.type) {
  case JsonValue::Type::kString:
    return value.string_value;
  case JsonValue::Type::kNumber:
    return value.number_text;
  case JsonValue::Type::kBool:
    return std::string(value.bool_value ? "true" : "false");
  case JsonValue::Type::kNull:
  case JsonValue::Type::kObject:
  case JsonValue::Type::kArray:
    break;
  }
  return std::nullopt;
}

void ExtractFromObjects(const std::vector<const JsonValue*>& objects,
                        const endpoints::EndpointDescriptor& endpoint, RawFieldMap& out) {
  for (const auto& [metric_key, payload_key] : endpoint.json_keys) {
    for (const JsonValue* object : objects) {
      const JsonValue* member = object->Find(payload_key);
      if (member == nullptr) {
        continue;
      }
      if (auto text = ScalarText(*member); text.has_value()) {
        out.fields.emplace(metric_key, std::move(*text));
        break;
      }
    }
  }
}

void ExtractFromIndices(const JsonValue& array, const endpoints::EndpointDescriptor& endpoint,
                        RawFieldMap& out) {
  for (const auto& [metric_key, index] : endpoint.array_indices) {
    if (out.fields.find(metric_key) != out.fields.end()) {
      continue;
    }
    const JsonValue* element = array.At(index);
    if (element == nullptr) {
      continue;
    }
    if (auto text = ScalarText(*element); text.has_value()) {
      out.fields.emplace(metric_key, std::move(*text));
    }
  }
}

bool IsBlank(std::string_view body) {
  return std::all_of(body.begin(), body.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

bool ParseJsonPayload(std::string_view body, const endpoints::EndpointDescriptor& endpoint,
                      RawFieldMap& out, std::string& error) {
  out = RawFieldMap{};
  error.clear();

  JsonValue root;
  if (!core::json::Parse(body, root, error)) {
    error = "invalid JSON from " + endpoint.path + ": " + error;
    return false;
  }

  if (root.IsObject()) {
    ExtractFromObjects({&root}, endpoint, out);
    return true;
  }

  if (root.IsArray()) {
    std::vector<const JsonValue*> objects;
    for (const JsonValue& element : root.array_value) {
      if (element.IsObject()) {
        objects.push_back(&element);
      }
    }
    if (!objects.empty()) {
      ExtractFromObjects(objects, endpoint, out);
    }
    ExtractFromIndices(root, endpoint, out);
    return true;
  }

  // A bare scalar is valid JSON that carries no mapped fields.
  return true;
}

bool ParsePayload(std::string_view body, const endpoints::EndpointDescriptor& endpoint,
                  RawFieldMap& out, std::string& error) {
  out = RawFieldMap{};
  error.clear();
  if (IsBlank(body)) {
    return true;
  }

  switch (endpoint.shape) {
  case endpoints::PayloadShape::kHtmlStatusTable:
    out = ParseHtmlStatusTable(body);
    return true;
  case endpoints::PayloadShape::kJson:
    return ParseJsonPayload(body, endpoint, out, error);
  }

  error = "unsupported payload shape for endpoint '" + endpoint.id + "'";
  return false;
}

} // namespace modemstat::parsers
