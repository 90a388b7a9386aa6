#pragma once
#include "fgen-engine/ParameterValue.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fgen {

/// Live state a few validation rules need: sibling values for cross-field
/// bounds and the discovered catalog for live option sets
struct ValidationContext {
  std::function<std::optional<double>(const std::string &key)> sibling_number;
  const std::vector<std::string> *live_options{nullptr};
};

/// Converts between typed parameter values and wire strings.
/// All functions are pure; failures throw CodecError.
class FGEN_ENGINE_API Codec {
public:
  /// Alias with {channel} substituted; device-scoped descriptors pass nullopt
  static std::string
  resolve_alias(const ParameterDescriptor &descriptor,
                const std::optional<std::string> &channel_alias);

  /// Validate `value` against the descriptor's policies and return the
  /// device token (InvalidOption on rejection)
  static std::string encode_value(const ParameterDescriptor &descriptor,
                                  const TypedValue &value,
                                  const ValidationContext &context = {});

  /// Full SET line
  static std::string encode(const ParameterDescriptor &descriptor,
                            const std::optional<std::string> &channel_alias,
                            const TypedValue &value,
                            const ValidationContext &context = {});

  /// SET line for an already validated token
  static std::string
  command_line(const ParameterDescriptor &descriptor,
               const std::optional<std::string> &channel_alias,
               const std::string &token);

  /// Full GET line
  static std::string
  build_query(const ParameterDescriptor &descriptor,
              const std::optional<std::string> &channel_alias);

  /// Reply -> typed value (MalformedResponse on failure)
  static TypedValue decode(const ParameterDescriptor &descriptor,
                           const std::string &response);

  /// What the instrument should report back after a successful write of
  /// `requested`: decode(encode(requested)) without the live-state checks
  static TypedValue normalize(const ParameterDescriptor &descriptor,
                              const TypedValue &requested);

  static bool equivalent(const ParameterDescriptor &descriptor,
                         const TypedValue &a, const TypedValue &b);

  /// Text from configuration, defaults or the command line
  static TypedValue parse_text(const ParameterDescriptor &descriptor,
                               const std::string &text);

  /// Waveform file names out of a catalog listing reply
  static std::vector<std::string> parse_catalog(const std::string &response);

  /// Strip line terminators and surrounding blanks
  static std::string trim_response(const std::string &response);

  static std::string format_number(double value);

private:
  static std::string to_token(const ParameterDescriptor &descriptor,
                              const TypedValue &value);
  static void apply_policies(const ParameterDescriptor &descriptor,
                             const TypedValue &value, const std::string &token,
                             const ValidationContext &context);
  static std::string apply_template(const std::string &format,
                                    const std::string &alias,
                                    const std::string &value);
};

} // namespace fgen
