#pragma once

#include "endpoints/strategy_table.hpp"
#include "parsers/raw_field_map.hpp"

#include <string>
#include <string_view>

namespace modemstat::parsers {

// Extracts the metrics `endpoint` maps from a JSON response body.
//
// Accepted shapes:
// - object: values looked up through `endpoint.json_keys`
// - array of objects: objects merged in order, first occurrence of a key wins
// - array of scalars: values looked up through `endpoint.array_indices`
//
// Contract:
// - returns false only when the body is not valid JSON (`error` says where)
// - unknown keys are ignored; missing keys/indices leave the field absent
// - null, nested objects and nested arrays count as absent
// - numbers keep their literal text; coercion is the normalizer's job so one
//   bad value never discards the rest of the payload
bool ParseJsonPayload(std::string_view body, const endpoints::EndpointDescriptor& endpoint,
                      RawFieldMap& out, std::string& error);

// Dispatches on `endpoint.shape`. A blank body yields an empty map, not an error.
bool ParsePayload(std::string_view body, const endpoints::EndpointDescriptor& endpoint,
                  RawFieldMap& out, std::string& error);

} // namespace modemstat::parsers
