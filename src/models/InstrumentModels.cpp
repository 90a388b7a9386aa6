#include "fgen-engine/models/InstrumentModels.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace fgen {
namespace models {

using Relation = CrossFieldRule::Relation;

const std::map<std::string, std::string> &function_shape_table() {
  static const std::map<std::string, std::string> table = {
      {"Sine", "SIN"},
      {"Square", "SQU"},
      {"Ramp", "RAMP"},
      {"Triangle", "TRI"},
      {"Pulse", "PULS"},
      {"Noise", "NOIS"},
      {"PRBS", "PRBS"},
      {"Arbitrary", "ARB"},
      {"DC", "DC"},
      {"PR Noise", "PRN"},
      {"Sin(x)/x", "SINC"},
      {"Lorentz", "LOR"},
      {"Exponential Rise", "ERIS"},
      {"Exponential Decay", "EDEC"},
      {"Haversine", "HAV"}};
  return table;
}

ParameterSchema::Builder function_generator_builder(const std::string &model) {
  ParameterSchema::Builder builder(model);
  // No reply on commands, so every parameter is queried after a set
  builder.defaults(PolicyDefaults{true, true});

  builder.add(DescriptorBuilder::text("identification", "*IDN")
                  .displayed_name("Identification")
                  .description("Identification information.")
                  .read_only());

  builder.add(DescriptorBuilder::text("systemError", "SYSTem:ERRor")
                  .displayed_name("System error")
                  .description("System Error raised on hardware.")
                  .read_only()
                  .polled()
                  .ignore_response_containing("No error"));
  return builder;
}

namespace {

DescriptorBuilder pulse_width(const std::string &alias) {
  return DescriptorBuilder::number("pulseWidth", alias)
      .displayed_name("Pulse width")
      .unit("s")
      .unit_suffix("s")
      .description("Time from the 50% threshold of a pulse's rising edge to "
                   "the 50% threshold of the next falling edge. Must be less "
                   "than the period.")
      .cross_field("pulse-width-within-period", "pulsePeriod",
                   Relation::NotGreaterThan);
}

DescriptorBuilder pulse_period(const std::string &alias) {
  return DescriptorBuilder::number("pulsePeriod", alias)
      .displayed_name("Pulse period")
      .unit("s")
      .unit_suffix("s")
      .description("Period of pulse waveform.");
}

std::vector<DescriptorBuilder> join(std::vector<DescriptorBuilder> head,
                                    std::vector<DescriptorBuilder> tail) {
  head.insert(head.end(), tail.begin(), tail.end());
  return head;
}

ParameterSchema::Builder keysight_builder(const std::string &model) {
  auto builder = function_generator_builder(model);

  builder.add(DescriptorBuilder::enumeration("phaseUnit", "UNIT:ANGLe",
                                             {"DEG", "RAD"})
                  .displayed_name("Phase Unit")
                  .description("Unit of Phase offset angle of waveform.")
                  .default_value("DEG"));

  builder.add(
      DescriptorBuilder::text("arbPath", "")
          .displayed_name("Waveform Paths")
          .description("File paths for arbitrary waveforms. Use backslash to "
                       "separate folders. No backslash at the end!")
          .default_value("INT:\\BUILTIN"));

  builder.add(DescriptorBuilder::text("availableArbs", "")
                  .displayed_name("Available Waveforms")
                  .description("Available arbitrary waveforms on the "
                               "hardware. A sequence file needs every "
                               "waveform it references loaded first.")
                  .live_options());

  builder.add(DescriptorBuilder::enumeration("display", "DISPlay", {"ON", "OFF"})
                  .displayed_name("Display")
                  .description("Turn Display on or off. OFF on start of "
                               "device. Control on hardware side can be "
                               "reclaimed by pressing the 'Local' key")
                  .bool_normalize(true)
                  .default_value("OFF")
                  .read_on_connect(false)
                  .write_on_connect()
                  .read_back());

  builder.add(DescriptorBuilder::text("arbs", "MMEMory:CAT:DATA:ARB")
                  .displayed_name("Request Arbs")
                  .description("Request available arbitrary waveforms.")
                  .command_format("{alias}? {value}\n")
                  .default_value("INT:\\BUILTIN")
                  .expert()
                  .read_only()
                  .read_on_connect(false)
                  .read_back(false)
                  .returns_response());

  builder.catalog(CatalogSpec{"arbs", "arbPath", "availableArbs", true});
  return builder;
}

} // namespace

std::vector<DescriptorBuilder> base_channel_parameters() {
  return {
      DescriptorBuilder::enumeration("outputState", "OUTPut{channel}",
                                     {"ON", "OFF"})
          .displayed_name("Output State")
          .description("Enable the output for the channel.")
          .bool_normalize(),
      DescriptorBuilder::enumeration("outputPol", "OUTPut{channel}:POL",
                                     {"NORM", "INV"})
          .displayed_name("Output Polarity")
          .description("Inverts waveform relative to offset voltage."),
      DescriptorBuilder::number("offset", "SOURce{channel}:VOLT:OFFS")
          .displayed_name("Offset")
          .unit("V")
          .description("Offset level for the specified channel.")
          .polled(),
      DescriptorBuilder::number("amplitude", "SOURce{channel}:VOLT")
          .displayed_name("Amplitude")
          .description("Output amplitude for the specified channel. Unit is "
                       "set by amplitude unit value.")
          .polled(),
      DescriptorBuilder::enumeration("amplitudeUnit",
                                     "SOURce{channel}:VOLT:UNIT",
                                     {"VPP", "VRMS", "DBM"})
          .displayed_name("Amplitude Unit")
          .default_value("VPP"),
      DescriptorBuilder::number("voltageLow", "SOURce{channel}:VOLT:LOW")
          .displayed_name("Voltage Low")
          .unit("V")
          .description("Waveform low voltage.")
          .polled(),
      DescriptorBuilder::number("voltageHigh", "SOURce{channel}:VOLT:HIGH")
          .displayed_name("Voltage High")
          .unit("V")
          .description("Waveform high voltage.")
          .polled(),
      DescriptorBuilder::number("frequency", "SOURce{channel}:FREQ")
          .displayed_name("Frequency")
          .unit("Hz")
          .polled(),
      DescriptorBuilder::number("phase", "SOURce{channel}:PHASe")
          .displayed_name("Phase")
          .description("Phase offset angle of waveform for the channel.")
          .polled(),
      DescriptorBuilder::enumeration("burstState", "SOURce{channel}:BURSt:STAT",
                                     {"ON", "OFF"})
          .displayed_name("Burst State")
          .bool_normalize()
          .default_value("OFF")
          .polled(),
      DescriptorBuilder::enumeration("burstMode", "SOURce{channel}:BURSt:MODE",
                                     {"TRIG", "GAT"})
          .displayed_name("Burst Mode")
          .description("TRIG: triggered burst mode. GAT: gated burst mode.")
          .default_value("TRIG"),
      DescriptorBuilder::text("burstCycles", "SOURce{channel}:BURSt:NCYC")
          .displayed_name("Burst Cycles")
          .description("Number of cycles to be output in burst mode.")
          .default_value("INF"),
      DescriptorBuilder::number("frequencyStart", "SOURce{channel}:FREQ:STAR")
          .displayed_name("Start Frequency")
          .unit("Hz"),
      DescriptorBuilder::number("frequencyStop", "SOURce{channel}:FREQ:STOP")
          .displayed_name("Stop Frequency")
          .unit("Hz"),
      DescriptorBuilder::number("sweepTime", "SOURce{channel}:SWE:TIME")
          .displayed_name("Sweep Time")
          .unit("s"),
      DescriptorBuilder::number("sweepHoldTime", "SOURce{channel}:SWE:HTIM")
          .displayed_name("Sweep Hold Time")
          .unit("s"),
      DescriptorBuilder::number("sweepReturnTime", "SOURce{channel}:SWE:RTIM")
          .displayed_name("Sweep Return Time")
          .unit("s")
          .description("Time from stop frequency back to start frequency."),
  };
}

std::vector<DescriptorBuilder> keysight_channel_parameters() {
  return join(
      base_channel_parameters(),
      {
          DescriptorBuilder::number("outputLoad", "OUTPut{channel}:LOAD")
              .displayed_name("Output load")
              .description("Expected output termination."),
          DescriptorBuilder::enumeration("functionShape",
                                         "SOURce{channel}:FUNCtion",
                                         {"SIN", "SQU", "RAMP", "NRAM", "TRI",
                                          "PULS", "NOIS", "PRBS", "ARB", "DC"})
              .displayed_name("Function Shape")
              .translate(function_shape_table())
              .default_value("SIN"),
          pulse_width("SOURce{channel}:FUNC:PULS:WIDT"),
          pulse_period("SOURce{channel}:FUNC:PULS:PER"),
          DescriptorBuilder::text("arbitraryForm", "SOURce{channel}:FUNC:ARB")
              .displayed_name("Select Arbitrary Form")
              .description("Select arbitrary waveform in memory."),
          // Load has no query form
          DescriptorBuilder::text("loadForm", "MMEMory:LOAD:DATA{channel}")
              .displayed_name("Load Arbitrary Form")
              .description("Load file with arbitrary waveform.")
              .read_on_connect(false)
              .read_back(false),
          DescriptorBuilder::number("arbitraryPeriod",
                                    "SOURce{channel}:FUNC:ARB:PER")
              .displayed_name("Arbitrary period")
              .unit("s")
              .unit_suffix("s"),
          DescriptorBuilder::number("rampSymmetry",
                                    "SOURce{channel}:FUNC:RAMP:SYMM")
              .displayed_name("Ramp Symmetry")
              .unit("%")
              .range(0.0, 100.0),
          DescriptorBuilder::enumeration("triggerSource", "TRIG{channel}:SOUR",
                                         {"TIM", "EXT", "BUS", "IMM"})
              .displayed_name("Trigger Source")
              .description("Immediate or timed internal trigger, external or "
                           "software (BUS) trigger.")
              .default_value("TIM"),
          DescriptorBuilder::number("triggerTime", "TRIG{channel}:TIM")
              .displayed_name("Trigger Time")
              .unit("s")
              .unit_suffix("s")
              .default_value("10"),
      });
}

std::vector<DescriptorBuilder> keysight_3500_channel_parameters() {
  return {
      pulse_width("SOURce{channel}:FUNC:PULS:WIDT").read_back(false),
      pulse_period("SOURce{channel}:FUNC:PULS:PER").read_back(false),
      DescriptorBuilder::number("frequency",
                                "SOURce{channel}:FUNCtion:ARBitrary:FREQ")
          .displayed_name("Frequency")
          .unit("Hz")
          .unit_suffix("Hz")
          .read_back(false),
      DescriptorBuilder::enumeration("triggerSource", "TRIG{channel}:SOUR",
                                     {"TIM", "EXT"})
          .displayed_name("Trigger Source")
          .default_value("TIM")
          .read_back(false),
      DescriptorBuilder::number("triggerTime", "TRIG{channel}:TIM")
          .displayed_name("Trigger Time")
          .unit("s")
          .unit_suffix("s")
          .range(1e-6, 500.0)
          .default_value("10")
          .read_back(false),
  };
}

std::vector<DescriptorBuilder> afg_channel_parameters() {
  return join(
      base_channel_parameters(),
      {
          DescriptorBuilder::enumeration(
              "functionShape", "SOURce{channel}:FUNCtion",
              {"SIN", "SQU", "PULS", "RAMP", "PRN", "DC", "SINC", "GAUS",
               "LOR", "ERIS", "EDEC", "EMEM"})
              .displayed_name("Function Shape")
              .translate(function_shape_table())
              .default_value("PULS"),
          pulse_width("SOURce{channel}:PULS:WIDT"),
          pulse_period("SOURce{channel}:PULS:PER"),
          DescriptorBuilder::enumeration("burstIdle",
                                         "SOURce{channel}:BURSt:IDLE",
                                         {"START", "DC", "END", "OFF"})
              .displayed_name("Burst Idle")
              .description("Output level between two burst outputs.")
              .default_value("OFF"),
          // A number of seconds, or MIN/MAX
          DescriptorBuilder::text("burstDelay", "SOURce{channel}:BURS:TDEL")
              .displayed_name("Burst Delay")
              .unit("s")
              .unit_suffix("s")
              .range(0.0, 85.0)
              .default_value("MIN"),
          DescriptorBuilder::enumeration("sweepMode",
                                         "SOURce{channel}:SWE:MODE",
                                         {"AUTO", "MAN"})
              .displayed_name("Sweep Mode")
              .default_value("AUTO"),
      });
}

ParameterSchema make_keysight_33512_schema() {
  auto builder = keysight_builder("Keysight33512");
  builder.add_channel("channel_1", "1", "channel 1",
                      keysight_channel_parameters());
  builder.add_channel("channel_2", "2", "channel 2",
                      keysight_channel_parameters());
  return builder.build();
}

ParameterSchema make_keysight_33511_schema() {
  auto builder = function_generator_builder("Keysight33511");
  builder.add_channel("channel_1", "1", "channel 1",
                      keysight_channel_parameters());
  return builder.build();
}

ParameterSchema make_keysight_3500_schema() {
  auto builder = function_generator_builder("Keysight3500");
  builder.add_channel("keysight_ch_1", "1", "keysight ch 1",
                      keysight_3500_channel_parameters());
  builder.add_channel("keysight_ch_2", "2", "keysight ch 2",
                      keysight_3500_channel_parameters());
  return builder.build();
}

ParameterSchema make_afg31000_schema() {
  auto builder = function_generator_builder("AFG31000");

  builder.add(DescriptorBuilder::enumeration("triggerMode", "OUTP:TRIG:MODE",
                                             {"TRIG", "SYNC"})
                  .displayed_name("Trigger Mode")
                  .description("Mode (trigger or sync) for the Trigger "
                               "Output signal.")
                  .default_value("TRIG"));
  builder.add(DescriptorBuilder::enumeration("triggerSource", "TRIG:SOUR",
                                             {"TIM", "EXT"})
                  .displayed_name("Trigger Source")
                  .default_value("TIM"));
  builder.add(DescriptorBuilder::number("triggerTime", "TRIG:TIM")
                  .displayed_name("Trigger Time")
                  .unit("s")
                  .unit_suffix("s")
                  .range(1e-6, 500.0)
                  .default_value("10"));
  builder.add(DescriptorBuilder::enumeration("runMode", "SEQC:RMOD",
                                             {"CONT", "TRIG", "GAT", "SEQ"})
                  .displayed_name("Run Mode")
                  .default_value("CONT"));

  builder.add_channel("channel_1", "1", "channel 1", afg_channel_parameters());
  builder.add_channel("channel_2", "2", "channel 2", afg_channel_parameters());
  return builder.build();
}

std::vector<std::string> available_models() {
  return {"Keysight33512", "Keysight33511", "Keysight3500", "AFG31000"};
}

ParameterSchema make_schema(const std::string &model) {
  if (model == "Keysight33512")
    return make_keysight_33512_schema();
  if (model == "Keysight33511")
    return make_keysight_33511_schema();
  if (model == "Keysight3500")
    return make_keysight_3500_schema();
  if (model == "AFG31000")
    return make_afg31000_schema();
  throw std::invalid_argument(fmt::format("Unknown instrument model '{}'", model));
}

} // namespace models
} // namespace fgen
