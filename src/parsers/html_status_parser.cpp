#include "parsers/html_status_parser.hpp"

#include "endpoints/metric_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>

namespace modemstat::parsers {

namespace {

constexpr std::size_t kNpos = std::string::npos;

struct LabelRule {
  std::string_view metric_key;
  std::array<std::string_view, 2> aliases;
};

// Status rows are matched by label substring after label normalization.
constexpr std::array<LabelRule, 2> kLabelRules = {{
    {endpoints::keys::kCableModemStatus, {"cable modem status", "cm status"}},
    {endpoints::keys::kPrimaryDownstreamChannel,
     {"primary downstream channel", "primary downstream lock"}},
}};

std::string ToLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string collapsed;
  collapsed.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (IsSpace(c)) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(c);
  }
  return collapsed;
}

struct NonContentBlock {
  std::string_view open;
  std::string_view close;
};

constexpr std::array<NonContentBlock, 2> kNonContentBlocks = {{
    {"<script", "</script"},
    {"<style", "</style"},
}};

// Drops comments and script/style bodies; both may contain markup-like text.
std::string StripNonContent(std::string_view html) {
  std::string out;
  out.reserve(html.size());
  const std::string lower = ToLowerAscii(html);

  std::size_t pos = 0;
  while (pos < html.size()) {
    if (lower.compare(pos, 4, "<!--") == 0) {
      const std::size_t end = lower.find("-->", pos + 4);
      pos = end == kNpos ? html.size() : end + 3;
      continue;
    }
    bool skipped = false;
    for (const NonContentBlock& block : kNonContentBlocks) {
      if (lower.compare(pos, block.open.size(), block.open) == 0) {
        const std::size_t end = lower.find(block.close, pos);
        if (end == kNpos) {
          pos = html.size();
        } else {
          const std::size_t close = lower.find('>', end);
          pos = close == kNpos ? html.size() : close + 1;
        }
        skipped = true;
        break;
      }
    }
    if (skipped) {
      continue;
    }
    out.push_back(html[pos]);
    ++pos;
  }
  return out;
}

// Finds "<tag" followed by '>', '/', or whitespace so "<tr" never matches "<track".
std::size_t FindTagOpen(const std::string& lower, std::string_view tag, std::size_t from) {
  const std::string needle = "<" + std::string(tag);
  std::size_t pos = lower.find(needle, from);
  while (pos != kNpos) {
    const std::size_t after = pos + needle.size();
    if (after >= lower.size()) {
      return kNpos;
    }
    const char next = lower[after];
    if (next == '>' || next == '/' || IsSpace(next)) {
      return pos;
    }
    pos = lower.find(needle, after);
  }
  return kNpos;
}

std::size_t MinPos(std::initializer_list<std::size_t> positions) {
  std::size_t best = kNpos;
  for (const std::size_t pos : positions) {
    best = std::min(best, pos);
  }
  return best;
}

std::optional<std::string> DecodeEntity(std::string_view entity) {
  if (entity == "nbsp" || entity == "#160") {
    return std::string(" ");
  }
  if (entity == "amp") {
    return std::string("&");
  }
  if (entity == "lt") {
    return std::string("<");
  }
  if (entity == "gt") {
    return std::string(">");
  }
  if (entity == "quot") {
    return std::string("\"");
  }
  if (entity == "apos" || entity == "#39") {
    return std::string("'");
  }
  if (entity.size() > 1U && entity.front() == '#') {
    const std::string digits(entity.substr(1));
    char* end = nullptr;
    const long code = std::strtol(digits.c_str(), &end, 10);
    if (end != nullptr && *end == '\0' && code > 0 && code < 0x80) {
      return std::string(1, static_cast<char>(code));
    }
  }
  return std::nullopt;
}

// Visible text of one cell fragment. Tags become spaces so "<br>" separates words.
std::string CellText(std::string_view fragment) {
  std::string text;
  text.reserve(fragment.size());
  std::size_t pos = 0;
  while (pos < fragment.size()) {
    const char c = fragment[pos];
    if (c == '<') {
      const std::size_t close = fragment.find('>', pos);
      text.push_back(' ');
      pos = close == std::string_view::npos ? fragment.size() : close + 1;
      continue;
    }
    if (c == '&') {
      const std::size_t semi = fragment.find(';', pos);
      if (semi != std::string_view::npos && semi - pos <= 8U) {
        const auto decoded = DecodeEntity(ToLowerAscii(fragment.substr(pos + 1, semi - pos - 1)));
        if (decoded.has_value()) {
          text += *decoded;
          pos = semi + 1;
          continue;
        }
      }
    }
    text.push_back(c);
    ++pos;
  }
  return CollapseWhitespace(text);
}

HtmlRow ExtractCells(const std::string& cleaned, const std::string& lower, std::size_t begin,
                     std::size_t end) {
  HtmlRow row;
  std::size_t pos = begin;
  while (pos < end) {
    const std::size_t cell_start =
        MinPos({FindTagOpen(lower, "td", pos), FindTagOpen(lower, "th", pos)});
    if (cell_start == kNpos || cell_start >= end) {
      break;
    }
    std::size_t content_begin = lower.find('>', cell_start);
    if (content_begin == kNpos || content_begin >= end) {
      break;
    }
    ++content_begin;

    const std::size_t cell_end =
        MinPos({lower.find("</td", content_begin), lower.find("</th", content_begin),
                FindTagOpen(lower, "td", content_begin), FindTagOpen(lower, "th", content_begin),
                end});
    row.push_back(CellText(std::string_view(cleaned).substr(content_begin,
                                                             cell_end - content_begin)));
    pos = cell_end;
  }
  return row;
}

// Lowercase, single-spaced, without ':' so "Cable  Modem Status:" == "cable modem status".
std::string NormalizeLabel(std::string_view label) {
  std::string lowered = ToLowerAscii(label);
  lowered.erase(std::remove(lowered.begin(), lowered.end(), ':'), lowered.end());
  return CollapseWhitespace(lowered);
}

// True when `token` ("3.0") appears in `text` not embedded in a longer number.
bool HasVersionToken(std::string_view text, std::string_view token) {
  std::size_t pos = text.find(token);
  while (pos != std::string_view::npos) {
    const bool left_ok =
        pos == 0U || (std::isdigit(static_cast<unsigned char>(text[pos - 1])) == 0 &&
                      text[pos - 1] != '.');
    const std::size_t after = pos + token.size();
    const bool right_ok =
        after >= text.size() || (std::isdigit(static_cast<unsigned char>(text[after])) == 0 &&
                                 text[after] != '.');
    if (left_ok && right_ok) {
      return true;
    }
    pos = text.find(token, pos + 1);
  }
  return false;
}

bool ClassifyChannelRow(const HtmlRow& row, ChannelRow& channel) {
  std::optional<DocsisVersion> version;
  std::optional<ChannelDirection> direction;
  for (const std::string& cell : row) {
    const std::string lowered = ToLowerAscii(cell);
    if (!version.has_value()) {
      if (HasVersionToken(lowered, "3.1")) {
        version = DocsisVersion::k31;
      } else if (HasVersionToken(lowered, "3.0")) {
        version = DocsisVersion::k30;
      }
    }
    if (!direction.has_value()) {
      if (lowered.find("downstream") != kNpos || lowered == "ds") {
        direction = ChannelDirection::kDownstream;
      } else if (lowered.find("upstream") != kNpos || lowered == "us") {
        direction = ChannelDirection::kUpstream;
      }
    }
  }
  if (!version.has_value() || !direction.has_value()) {
    return false;
  }
  channel.version = *version;
  channel.direction = *direction;
  return true;
}

const LabelRule* MatchLabelRule(const std::string& label) {
  for (const LabelRule& rule : kLabelRules) {
    for (const std::string_view alias : rule.aliases) {
      if (!alias.empty() && label.find(alias) != kNpos) {
        return &rule;
      }
    }
  }
  return nullptr;
}

} // namespace

std::vector<HtmlRow> ExtractTableRows(std::string_view html) {
  std::vector<HtmlRow> rows;
  const std::string cleaned = StripNonContent(html);
  const std::string lower = ToLowerAscii(cleaned);

  // Rows are read in document order at any table nesting depth. A row ends at
  // its close tag, the next row, or the next table boundary, so a layout table
  // nested inside a cell never hides the rows that follow it.
  std::size_t next_open = FindTagOpen(lower, "table", 0);
  std::size_t next_close = lower.find("</table", 0);
  std::size_t next_row = FindTagOpen(lower, "tr", 0);
  int depth = 0;
  std::size_t cursor = 0;
  while (true) {
    if (next_open != kNpos && next_open < cursor) {
      next_open = FindTagOpen(lower, "table", cursor);
    }
    if (next_close != kNpos && next_close < cursor) {
      next_close = lower.find("</table", cursor);
    }
    if (next_row != kNpos && next_row < cursor) {
      next_row = FindTagOpen(lower, "tr", cursor);
    }

    const std::size_t next = MinPos({next_open, next_close, next_row});
    if (next == kNpos) {
      break;
    }
    if (next == next_open) {
      ++depth;
      cursor = next + 1;
      continue;
    }
    if (next == next_close) {
      depth = depth > 0 ? depth - 1 : 0;
      cursor = next + 1;
      continue;
    }
    if (depth == 0) {
      cursor = next + 1;
      continue;
    }

    std::size_t content_begin = lower.find('>', next);
    if (content_begin == kNpos) {
      break;
    }
    ++content_begin;
    const std::size_t row_end =
        MinPos({lower.find("</tr", content_begin), FindTagOpen(lower, "tr", content_begin),
                FindTagOpen(lower, "table", content_begin), lower.find("</table", content_begin),
                lower.size()});
    HtmlRow row = ExtractCells(cleaned, lower, content_begin, row_end);
    if (!row.empty()) {
      rows.push_back(std::move(row));
    }
    cursor = std::max(row_end, next + 1);
  }
  return rows;
}

RawFieldMap ParseHtmlStatusTable(std::string_view html) {
  RawFieldMap map;
  for (const HtmlRow& row : ExtractTableRows(html)) {
    if (row.empty()) {
      continue;
    }

    const std::string label = NormalizeLabel(row.front());
    if (const LabelRule* rule = MatchLabelRule(label); rule != nullptr) {
      if (row.size() >= 2U && !row[1].empty()) {
        map.fields.emplace(std::string(rule->metric_key), row[1]);
      }
      continue;
    }

    if (label.find("channels") != kNpos) {
      continue;
    }

    ChannelRow channel;
    if (ClassifyChannelRow(row, channel)) {
      map.channel_rows.push_back(channel);
    }
  }
  return map;
}

} // namespace modemstat::parsers
