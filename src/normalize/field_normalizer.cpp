#include "normalize/field_normalizer.hpp"

#include "normalize/lookup_tables.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

namespace modemstat::normalize {

namespace {

namespace keys = endpoints::keys;
using endpoints::ValueKind;

enum class Rule {
  kText,
  kCodeLookup,
  kOperationalStatus,
  kBoolean,
  kInteger,
  kRate,
};

struct BooleanLabels {
  std::string_view when_true;
  std::string_view when_false;
};

struct FieldRule {
  std::string_view key;
  Rule rule = Rule::kText;
  const LookupTable* table = nullptr;
  BooleanLabels labels;
};

// Modems report "online" as any operational state at or past ranging complete.
constexpr std::int64_t kOnlineThreshold = 3;
// Upper bound for a per-version channel count; anything larger is a bad report.
constexpr std::int64_t kMaxChannelCount = 1024;

const std::vector<FieldRule>& FieldRules() {
  static const std::vector<FieldRule> rules = {
      {keys::kCableModemStatus, Rule::kOperationalStatus, nullptr, {}},
      {keys::kPrimaryDownstreamChannel, Rule::kBoolean, nullptr, {"Locked", "Not Locked"}},
      {keys::kDocsisVersion, Rule::kText, nullptr, {}},
      {keys::kCableModemRegistration, Rule::kCodeLookup, &RegistrationTable(), {}},
      {keys::kWanIpProvisionMode, Rule::kCodeLookup, &WanIpProvisionModeTable(), {}},
      {keys::kFailSafeMode, Rule::kBoolean, nullptr, {"Active", "Inactive"}},
      {keys::kNoRfDetected, Rule::kBoolean, nullptr, {"Yes", "No"}},
      {keys::kDocsis30Downstream, Rule::kInteger, nullptr, {}},
      {keys::kDocsis30Upstream, Rule::kInteger, nullptr, {}},
      {keys::kDocsis31Downstream, Rule::kInteger, nullptr, {}},
      {keys::kDocsis31Upstream, Rule::kInteger, nullptr, {}},
      {keys::kTotalDownstreamChannels, Rule::kInteger, nullptr, {}},
      {keys::kTotalUpstreamChannels, Rule::kInteger, nullptr, {}},
      {keys::kLastUpdateTime, Rule::kText, nullptr, {}},
      {keys::kIspProvider, Rule::kCodeLookup, &IspProviderTable(), {}},
      {keys::kNetworkAccess, Rule::kCodeLookup, &NetworkAccessTable(), {}},
      {keys::kMaxCpes, Rule::kInteger, nullptr, {}},
      {keys::kBaselinePrivacy, Rule::kBoolean, nullptr, {"Enabled", "Disabled"}},
      {keys::kDocsisMode, Rule::kCodeLookup, &DocsisModeTable(), {}},
      {keys::kConfigFile, Rule::kText, nullptr, {}},
      {keys::kPrimaryDownstreamSfid, Rule::kInteger, nullptr, {}},
      {keys::kPrimaryDownstreamMaxTrafficRate, Rule::kRate, nullptr, {}},
      {keys::kPrimaryDownstreamMaxTrafficBurst, Rule::kRate, nullptr, {}},
      {keys::kPrimaryDownstreamMinTrafficRate, Rule::kRate, nullptr, {}},
      {keys::kPrimaryUpstreamSfid, Rule::kInteger, nullptr, {}},
      {keys::kPrimaryUpstreamMaxTrafficRate, Rule::kRate, nullptr, {}},
      {keys::kPrimaryUpstreamMaxTrafficBurst, Rule::kRate, nullptr, {}},
      {keys::kPrimaryUpstreamMinTrafficRate, Rule::kRate, nullptr, {}},
      {keys::kPrimaryUpstreamMaxConcatenatedBurst, Rule::kRate, nullptr, {}},
      {keys::kPrimaryUpstreamSchedulingType, Rule::kCodeLookup, &SchedulingTypeTable(), {}},
  };
  return rules;
}

const FieldRule* FindRule(std::string_view key) {
  const auto& rules = FieldRules();
  const auto it = std::find_if(rules.begin(), rules.end(),
                               [key](const FieldRule& rule) { return rule.key == key; });
  return it == rules.end() ? nullptr : &*it;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::string LowerCollapsed(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (IsSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// Fallback labels produced by an earlier pass stay untouched on re-normalization.
bool IsFallbackLabel(std::string_view text) {
  return text.rfind("Unknown ", 0) == 0;
}

std::optional<std::int64_t> ParseCode(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const bool negative = text.front() == '-';
  const std::string_view digits = negative ? text.substr(1) : text;
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> ParseBooleanLike(std::string_view text) {
  static constexpr std::array<std::string_view, 8> kTrue = {
      "1", "yes", "true", "enabled", "enable", "on", "active", "locked"};
  static constexpr std::array<std::string_view, 10> kFalse = {
      "0", "no", "false", "disabled", "disable", "off", "inactive", "not locked", "unlocked",
      "not detected"};
  const std::string lowered = LowerCollapsed(text);
  if (std::find(kTrue.begin(), kTrue.end(), lowered) != kTrue.end()) {
    return true;
  }
  if (std::find(kFalse.begin(), kFalse.end(), lowered) != kFalse.end()) {
    return false;
  }
  return std::nullopt;
}

struct NumberWithUnit {
  std::string number;
  std::string unit;
  std::optional<std::int64_t> integral;
};

// Accepts "<digits>[.<digits>][ <unit>]" where the unit starts with a letter.
std::optional<NumberWithUnit> ParseNumberWithUnit(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  const std::size_t int_end = pos;
  if (int_end == 0U) {
    return std::nullopt;
  }

  std::size_t frac_end = int_end;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    if (pos == int_end + 1U) {
      return std::nullopt;
    }
    frac_end = pos;
  }

  const std::string_view unit = Trim(text.substr(frac_end));
  if (!unit.empty() && std::isalpha(static_cast<unsigned char>(unit.front())) == 0) {
    return std::nullopt;
  }

  NumberWithUnit parsed;
  parsed.number = std::string(text.substr(0, frac_end));
  parsed.unit = std::string(unit);

  const std::string_view fraction =
      frac_end > int_end ? text.substr(int_end + 1U, frac_end - int_end - 1U) : std::string_view();
  const bool integral =
      std::all_of(fraction.begin(), fraction.end(), [](char c) { return c == '0'; });
  if (integral) {
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + int_end, value);
    if (ec != std::errc() || ptr != text.data() + int_end) {
      return std::nullopt;
    }
    parsed.integral = value;
  }
  return parsed;
}

std::string WithUnit(std::string number, const std::string& unit) {
  if (!unit.empty()) {
    number += ' ';
    number += unit;
  }
  return number;
}

NormalizedValue Passthrough(ValueKind kind, std::string_view trimmed, std::string_view raw) {
  NormalizedValue value;
  value.kind = kind;
  value.text = std::string(trimmed);
  value.raw = std::string(raw);
  return value;
}

NormalizedValue NormalizeCodeLookup(const FieldRule& rule, std::string_view trimmed,
                                    std::string_view raw) {
  NormalizedValue value = Passthrough(ValueKind::kText, trimmed, raw);
  const auto code = ParseCode(trimmed);
  if (!code.has_value() || rule.table == nullptr) {
    return value;
  }
  value.integer = *code;
  if (const auto label = rule.table->Find(*code); label.has_value()) {
    value.text = std::string(*label);
  } else {
    value.text = rule.table->FallbackFor(*code);
    value.unmapped_code = true;
  }
  return value;
}

NormalizedValue NormalizeOperationalStatus(std::string_view trimmed, std::string_view raw) {
  NormalizedValue value = Passthrough(ValueKind::kText, trimmed, raw);
  if (const auto code = ParseCode(trimmed); code.has_value()) {
    value.integer = *code;
    value.text = *code >= kOnlineThreshold ? "Online" : "Offline";
  }
  return value;
}

NormalizedValue NormalizeBoolean(const FieldRule& rule, std::string_view trimmed,
                                 std::string_view raw) {
  if (IsFallbackLabel(trimmed)) {
    return Passthrough(ValueKind::kBoolean, trimmed, raw);
  }
  const auto parsed = ParseBooleanLike(trimmed);
  if (!parsed.has_value()) {
    const endpoints::MetricField* field = endpoints::FindMetricField(rule.key);
    NormalizedValue value = Passthrough(ValueKind::kBoolean, trimmed, raw);
    value.text = "Unknown " + std::string(field != nullptr ? field->display_name : rule.key) +
                 " (ID: " + std::string(trimmed) + ")";
    value.unmapped_code = true;
    return value;
  }
  NormalizedValue value = Passthrough(ValueKind::kBoolean, trimmed, raw);
  value.boolean = *parsed;
  value.text = std::string(*parsed ? rule.labels.when_true : rule.labels.when_false);
  return value;
}

NormalizedValue NormalizeNumeric(ValueKind kind, std::string_view trimmed, std::string_view raw) {
  const auto parsed = ParseNumberWithUnit(trimmed);
  if (!parsed.has_value()) {
    return MakeUnavailable(kind, raw);
  }
  if (kind == ValueKind::kInteger && !parsed->integral.has_value()) {
    return MakeUnavailable(kind, raw);
  }

  NormalizedValue value;
  value.kind = kind;
  value.raw = std::string(raw);
  value.unit = parsed->unit;
  value.integer = parsed->integral;
  if (parsed->integral.has_value()) {
    value.text = WithUnit(std::to_string(*parsed->integral), parsed->unit);
  } else {
    value.text = WithUnit(parsed->number, parsed->unit);
  }
  return value;
}

// Direct count for one version, or nullopt when the payload did not report it.
std::optional<NormalizedValue> DirectCount(const parsers::RawFieldMap& raw, std::string_view key) {
  const std::string* text = raw.Find(key);
  if (text == nullptr) {
    return std::nullopt;
  }
  NormalizedValue value = Normalize(key, *text);
  if (value.integer.has_value() && (*value.integer < 0 || *value.integer > kMaxChannelCount)) {
    return MakeUnavailable(ValueKind::kInteger, *text);
  }
  return value;
}

void AddDirectionTotal(const parsers::RawFieldMap& raw, std::string_view v30_key,
                       std::string_view v31_key, std::string_view total_key,
                       NormalizedFieldMap& out) {
  const auto v30 = DirectCount(raw, v30_key);
  const auto v31 = DirectCount(raw, v31_key);
  if (v30.has_value()) {
    out.insert_or_assign(std::string(v30_key), *v30);
  }
  if (v31.has_value()) {
    out.insert_or_assign(std::string(v31_key), *v31);
  }
  if (!v30.has_value() || !v31.has_value()) {
    return;
  }
  if (!v30->integer.has_value() || !v31->integer.has_value()) {
    out.insert_or_assign(std::string(total_key),
                         MakeUnavailable(ValueKind::kInteger, std::string_view()));
    return;
  }
  out.insert_or_assign(std::string(total_key), MakeCount(*v30->integer + *v31->integer));
}

} // namespace

NormalizedValue MakeUnavailable(ValueKind kind, std::string_view raw_value) {
  NormalizedValue value;
  value.kind = kind;
  value.available = false;
  value.text = std::string(kUnavailableText);
  value.raw = std::string(raw_value);
  return value;
}

NormalizedValue MakeCount(std::int64_t count) {
  NormalizedValue value;
  value.kind = ValueKind::kInteger;
  value.integer = count;
  value.text = std::to_string(count);
  value.raw = value.text;
  return value;
}

NormalizedValue Normalize(std::string_view field_key, std::string_view raw_value) {
  const std::string_view trimmed = Trim(raw_value);
  const FieldRule* rule = FindRule(field_key);
  if (rule == nullptr) {
    return Passthrough(ValueKind::kText, trimmed, raw_value);
  }

  const endpoints::MetricField* field = endpoints::FindMetricField(field_key);
  const ValueKind kind = field != nullptr ? field->kind : ValueKind::kText;
  if (trimmed.empty()) {
    return MakeUnavailable(kind, raw_value);
  }

  switch (rule->rule) {
  case Rule::kText:
    return Passthrough(kind, trimmed, raw_value);
  case Rule::kCodeLookup:
    return NormalizeCodeLookup(*rule, trimmed, raw_value);
  case Rule::kOperationalStatus:
    return NormalizeOperationalStatus(trimmed, raw_value);
  case Rule::kBoolean:
    return NormalizeBoolean(*rule, trimmed, raw_value);
  case Rule::kInteger:
    return NormalizeNumeric(ValueKind::kInteger, trimmed, raw_value);
  case Rule::kRate:
    return NormalizeNumeric(ValueKind::kRate, trimmed, raw_value);
  }
  return Passthrough(kind, trimmed, raw_value);
}

ChannelCounts TallyChannelRows(const std::vector<parsers::ChannelRow>& rows) {
  ChannelCounts counts;
  for (const parsers::ChannelRow& row : rows) {
    const bool downstream = row.direction == parsers::ChannelDirection::kDownstream;
    if (row.version == parsers::DocsisVersion::k31) {
      ++(downstream ? counts.downstream_31 : counts.upstream_31);
    } else {
      ++(downstream ? counts.downstream_30 : counts.upstream_30);
    }
  }
  return counts;
}

NormalizedFieldMap NormalizeFieldMap(const parsers::RawFieldMap& raw) {
  NormalizedFieldMap out;
  for (const auto& [key, text] : raw.fields) {
    if (endpoints::IsChannelCountKey(key)) {
      continue;
    }
    out.emplace(key, Normalize(key, text));
  }

  if (!raw.channel_rows.empty()) {
    const ChannelCounts counts = TallyChannelRows(raw.channel_rows);
    out.insert_or_assign(std::string(keys::kDocsis30Downstream), MakeCount(counts.downstream_30));
    out.insert_or_assign(std::string(keys::kDocsis30Upstream), MakeCount(counts.upstream_30));
    out.insert_or_assign(std::string(keys::kDocsis31Downstream), MakeCount(counts.downstream_31));
    out.insert_or_assign(std::string(keys::kDocsis31Upstream), MakeCount(counts.upstream_31));
    out.insert_or_assign(std::string(keys::kTotalDownstreamChannels),
                         MakeCount(counts.downstream_30 + counts.downstream_31));
    out.insert_or_assign(std::string(keys::kTotalUpstreamChannels),
                         MakeCount(counts.upstream_30 + counts.upstream_31));
    return out;
  }

  AddDirectionTotal(raw, keys::kDocsis30Downstream, keys::kDocsis31Downstream,
                    keys::kTotalDownstreamChannels, out);
  AddDirectionTotal(raw, keys::kDocsis30Upstream, keys::kDocsis31Upstream,
                    keys::kTotalUpstreamChannels, out);
  return out;
}

} // namespace modemstat::normalize
