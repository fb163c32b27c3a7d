#pragma once

#include "parsers/raw_field_map.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace modemstat::parsers {

// Flattened text of one table row, one entry per <td>/<th> cell.
using HtmlRow = std::vector<std::string>;

// Extracts every table row in document order. Cell text has nested tags
// removed, common entities decoded and whitespace collapsed. Returns an empty
// list when the document has no <table>.
std::vector<HtmlRow> ExtractTableRows(std::string_view html);

// Parses the modem's main status page.
//
// Contract:
// - never fails; a page without a recognizable status table yields an empty map
// - label rows ("Cable Modem Status", "Primary downstream channel") fill
//   fields from their second cell; label matching ignores case and spacing
// - every row tagged with a DOCSIS version (3.0/3.1) and a direction
//   (downstream/upstream) is recorded as one channel row; summary rows whose
//   label mentions "channels" are not tallied
RawFieldMap ParseHtmlStatusTable(std::string_view html);

} // namespace modemstat::parsers
