#include "fgen-engine/Codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace fgen {

namespace {

void replace_all(std::string &text, const std::string &from,
                 const std::string &to) {
  if (from.empty())
    return;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::optional<double> parse_double(const std::string &text) {
  if (text.empty())
    return std::nullopt;
  const char *begin = text.c_str();
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(value))
    return std::nullopt;
  return value;
}

std::string to_upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

bool contains(const std::vector<std::string> &list, const std::string &item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

std::string normalize_bool(const ParameterDescriptor &descriptor,
                           const TypedValue &value, bool lenient) {
  if (auto number = std::get_if<double>(&value)) {
    if (*number == 0.0)
      return "OFF";
    if (*number == 1.0 || lenient)
      return "ON";
  } else if (auto text = std::get_if<std::string>(&value)) {
    std::string upper = to_upper(*text);
    if (upper == "0" || upper == "OFF")
      return "OFF";
    if (upper == "1" || upper == "ON" || lenient)
      return "ON";
  } else if (lenient) {
    return "ON";
  }
  throw CodecError(ErrorKind::InvalidOption,
                   fmt::format("{} value {} is not one of the valid options",
                               descriptor.key, to_string(value)));
}

} // namespace

std::string
Codec::resolve_alias(const ParameterDescriptor &descriptor,
                     const std::optional<std::string> &channel_alias) {
  std::string alias = descriptor.alias_template;
  if (!descriptor.is_channel_scoped())
    return alias;
  if (!channel_alias) {
    throw CodecError(ErrorKind::InvalidOption,
                     fmt::format("{} is channel-scoped but no channel given",
                                 descriptor.key));
  }
  replace_all(alias, CHANNEL_PLACEHOLDER, *channel_alias);
  return alias;
}

std::string Codec::format_number(double value) {
  return fmt::format("{}", value);
}

std::string Codec::trim_response(const std::string &response) {
  size_t begin = 0;
  size_t end = response.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(response[begin])))
    ++begin;
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(response[end - 1])))
    --end;
  return response.substr(begin, end - begin);
}

std::string Codec::to_token(const ParameterDescriptor &descriptor,
                            const TypedValue &value) {
  if (std::holds_alternative<std::monostate>(value)) {
    if (auto rule = descriptor.find_policy<BoolNormalizeRule>())
      return normalize_bool(descriptor, value, rule->lenient);
    throw CodecError(ErrorKind::InvalidOption,
                     fmt::format("No value given for {}", descriptor.key));
  }

  switch (descriptor.kind) {
  case ParameterKind::Enum: {
    if (auto rule = descriptor.find_policy<BoolNormalizeRule>())
      return normalize_bool(descriptor, value, rule->lenient);

    std::string text = to_string(value);
    if (contains(descriptor.options, text))
      return text;
    auto mapped = descriptor.encode_map.find(text);
    if (mapped != descriptor.encode_map.end())
      return mapped->second;
    // Left for the option rule to reject
    return text;
  }
  case ParameterKind::Number: {
    if (auto number = std::get_if<double>(&value))
      return format_number(*number);
    auto parsed = parse_double(trim_response(std::get<std::string>(value)));
    if (!parsed) {
      throw CodecError(ErrorKind::InvalidOption,
                       fmt::format("{} expects a number, got '{}'",
                                   descriptor.key, to_string(value)));
    }
    return format_number(*parsed);
  }
  case ParameterKind::FreeString:
    return to_string(value);
  }
  return to_string(value);
}

void Codec::apply_policies(const ParameterDescriptor &descriptor,
                           const TypedValue &value, const std::string &token,
                           const ValidationContext &context) {
  std::optional<double> number;
  if (auto d = std::get_if<double>(&value))
    number = *d;
  else
    number = parse_double(token);

  for (const auto &policy : descriptor.policies) {
    std::visit(
        [&](auto &&rule) {
          using T = std::decay_t<decltype(rule)>;
          if constexpr (std::is_same_v<T, OptionSetRule>) {
            if (rule.live) {
              if (!context.live_options || context.live_options->empty()) {
                throw CodecError(
                    ErrorKind::InvalidOption,
                    fmt::format("No options discovered for {} yet",
                                descriptor.key));
              }
              if (!contains(*context.live_options, token)) {
                throw CodecError(
                    ErrorKind::InvalidOption,
                    fmt::format("{} value {} is not one of the discovered "
                                "options",
                                descriptor.key, token));
              }
            } else if (!rule.options.empty() &&
                       !contains(rule.options, token)) {
              throw CodecError(
                  ErrorKind::InvalidOption,
                  fmt::format("{} value {} is not one of the valid options",
                              descriptor.key, to_string(value)));
            }
          } else if constexpr (std::is_same_v<T, NumericRangeRule>) {
            if (!number)
              return; // symbolic values such as MIN/MAX
            if ((rule.min && *number < *rule.min) ||
                (rule.max && *number > *rule.max)) {
              throw CodecError(
                  ErrorKind::InvalidOption,
                  fmt::format("{} value {} is outside [{}, {}]",
                              descriptor.key, *number,
                              rule.min ? format_number(*rule.min) : "-inf",
                              rule.max ? format_number(*rule.max) : "inf"));
            }
          } else if constexpr (std::is_same_v<T, CrossFieldRule>) {
            if (!number || !context.sibling_number)
              return;
            auto other = context.sibling_number(rule.other_key);
            // Unknown (or unset) sibling: accept provisionally
            if (!other || *other == 0.0)
              return;
            bool violated =
                rule.relation == CrossFieldRule::Relation::NotGreaterThan
                    ? *number > *other
                    : *number < *other;
            if (violated) {
              throw CodecError(
                  ErrorKind::InvalidOption,
                  fmt::format("Invalid value for {}: {}. Has to be {} than "
                              "{} {} ({})",
                              descriptor.key, *number,
                              rule.relation ==
                                      CrossFieldRule::Relation::NotGreaterThan
                                  ? "smaller"
                                  : "larger",
                              rule.other_key, *other, rule.name));
            }
          }
        },
        policy);
  }
}

std::string Codec::encode_value(const ParameterDescriptor &descriptor,
                                const TypedValue &value,
                                const ValidationContext &context) {
  std::string token = to_token(descriptor, value);
  apply_policies(descriptor, value, token, context);
  return token;
}

std::string Codec::apply_template(const std::string &format,
                                  const std::string &alias,
                                  const std::string &value) {
  std::string out = format;
  replace_all(out, "{alias}", alias);
  replace_all(out, "{value}", value);
  return out;
}

std::string Codec::encode(const ParameterDescriptor &descriptor,
                          const std::optional<std::string> &channel_alias,
                          const TypedValue &value,
                          const ValidationContext &context) {
  return command_line(descriptor, channel_alias,
                      encode_value(descriptor, value, context));
}

std::string
Codec::command_line(const ParameterDescriptor &descriptor,
                    const std::optional<std::string> &channel_alias,
                    const std::string &token) {
  return apply_template(descriptor.command_format,
                        resolve_alias(descriptor, channel_alias), token);
}

std::string
Codec::build_query(const ParameterDescriptor &descriptor,
                   const std::optional<std::string> &channel_alias) {
  return apply_template(descriptor.query_format,
                        resolve_alias(descriptor, channel_alias), "");
}

TypedValue Codec::decode(const ParameterDescriptor &descriptor,
                         const std::string &response) {
  std::string text = trim_response(response);

  switch (descriptor.kind) {
  case ParameterKind::Enum: {
    auto mapped = descriptor.decode_map.find(text);
    if (mapped != descriptor.decode_map.end())
      return mapped->second;
    if (descriptor.find_policy<BoolNormalizeRule>()) {
      // instruments answer switches numerically
      if (text == "1")
        return std::string("ON");
      if (text == "0")
        return std::string("OFF");
    }
    if (descriptor.options.empty() || contains(descriptor.options, text))
      return text;
    throw CodecError(ErrorKind::MalformedResponse,
                     fmt::format("{} return value {} is not one of the valid "
                                 "options",
                                 descriptor.key, text));
  }
  case ParameterKind::Number: {
    auto parsed = parse_double(text);
    if (!parsed) {
      throw CodecError(ErrorKind::MalformedResponse,
                       fmt::format("{} return value '{}' is not a number",
                                   descriptor.key, text));
    }
    return *parsed;
  }
  case ParameterKind::FreeString:
    return text;
  }
  return text;
}

TypedValue Codec::normalize(const ParameterDescriptor &descriptor,
                            const TypedValue &requested) {
  std::string token = to_token(descriptor, requested);
  try {
    return decode(descriptor, token);
  } catch (const CodecError &) {
    // token the decoder does not know (e.g. a live option): compare as sent
    return token;
  }
}

bool Codec::equivalent(const ParameterDescriptor &descriptor,
                       const TypedValue &a, const TypedValue &b) {
  auto da = std::get_if<double>(&a);
  auto db = std::get_if<double>(&b);
  if (da && db) {
    double scale = std::max({1.0, std::fabs(*da), std::fabs(*db)});
    return std::fabs(*da - *db) <= 1e-9 * scale;
  }
  if (a == b)
    return true;
  if (descriptor.kind == ParameterKind::FreeString) {
    // "5" and "+5.00000000E+00" are the same burst count
    auto sa = std::get_if<std::string>(&a);
    auto sb = std::get_if<std::string>(&b);
    if (sa && sb) {
      auto na = parse_double(trim_response(*sa));
      auto nb = parse_double(trim_response(*sb));
      if (na && nb)
        return equivalent(descriptor, *na, *nb);
    }
  }
  return false;
}

TypedValue Codec::parse_text(const ParameterDescriptor &descriptor,
                             const std::string &text) {
  if (descriptor.kind == ParameterKind::Number) {
    auto parsed = parse_double(trim_response(text));
    if (!parsed) {
      throw CodecError(ErrorKind::InvalidOption,
                       fmt::format("{} expects a number, got '{}'",
                                   descriptor.key, text));
    }
    return *parsed;
  }
  return text;
}

std::vector<std::string> Codec::parse_catalog(const std::string &response) {
  std::vector<std::string> names;
  std::string text = trim_response(response);
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    std::string item = text.substr(
        start, comma == std::string::npos ? std::string::npos : comma - start);
    item.erase(std::remove(item.begin(), item.end(), '"'), item.end());
    item = trim_response(item);
    std::string upper = to_upper(item);
    if (upper.find(".ARB") != std::string::npos ||
        upper.find(".SEQ") != std::string::npos) {
      names.push_back(item);
    }
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return names;
}

} // namespace fgen
