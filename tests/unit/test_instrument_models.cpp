#include "fgen-engine/Codec.hpp"
#include "fgen-engine/models/InstrumentModels.hpp"

#include <gtest/gtest.h>

using namespace fgen;

TEST(InstrumentModelsTest, EveryBuiltInModelBuilds) {
  for (const auto &name : models::available_models()) {
    EXPECT_NO_THROW({
      auto schema = models::make_schema(name);
      EXPECT_EQ(schema.model(), name);
    }) << name;
  }
}

TEST(InstrumentModelsTest, UnknownModelThrows) {
  EXPECT_THROW(models::make_schema("Keysight99999"), std::invalid_argument);
}

TEST(InstrumentModelsTest, Keysight33512HasTwoChannelsAndCatalog) {
  auto schema = models::make_keysight_33512_schema();
  ASSERT_EQ(schema.channels().size(), 2u);
  EXPECT_EQ(schema.channels()[1].alias, "2");
  ASSERT_TRUE(schema.catalog().has_value());
  EXPECT_EQ(schema.catalog()->target_key, "availableArbs");
  EXPECT_NE(schema.find_device_parameter("display"), nullptr);
}

TEST(InstrumentModelsTest, Keysight33511IsSingleChannelWithoutCatalog) {
  auto schema = models::make_keysight_33511_schema();
  EXPECT_EQ(schema.channels().size(), 1u);
  EXPECT_FALSE(schema.catalog().has_value());
}

TEST(InstrumentModelsTest, FamilyDefaultsReadBackEveryCommand) {
  auto schema = models::make_keysight_33512_schema();
  auto node = schema.find_channel("1");
  auto offset = node->find("offset");
  ASSERT_NE(offset, nullptr);
  EXPECT_TRUE(offset->read_on_connect);
  EXPECT_TRUE(offset->command_read_back);
  EXPECT_TRUE(offset->is_polled());

  auto id = schema.find_device_parameter("identification");
  EXPECT_TRUE(id->read_only);
  EXPECT_FALSE(id->command_read_back);
}

TEST(InstrumentModelsTest, PulseWidthCommandCarriesUnit) {
  auto schema = models::make_keysight_33512_schema();
  auto node = schema.find_channel("channel_2");
  auto width = node->find("pulseWidth");
  ASSERT_NE(width, nullptr);
  EXPECT_EQ(Codec::encode(*width, node->alias, 0.001),
            "SOURce2:FUNC:PULS:WIDT 0.001 s\n");
  EXPECT_NE(width->find_policy<CrossFieldRule>(), nullptr);
}

TEST(InstrumentModelsTest, FunctionShapeAcceptsNamesAndTokens) {
  auto schema = models::make_keysight_33512_schema();
  auto node = schema.find_channel("1");
  auto shape = node->find("functionShape");
  EXPECT_EQ(Codec::encode_value(*shape, std::string("Square")), "SQU");
  EXPECT_EQ(Codec::encode_value(*shape, std::string("ARB")), "ARB");
  // Tektronix-only shapes are not offered on the Keysight
  EXPECT_THROW(Codec::encode_value(*shape, std::string("Lorentz")),
               CodecError);
  EXPECT_EQ(shape->encode_map.count("Lorentz"), 0u);
}

TEST(InstrumentModelsTest, AfgShapesIncludeLorentz) {
  auto schema = models::make_afg31000_schema();
  auto shape = schema.find_channel("1")->find("functionShape");
  EXPECT_EQ(Codec::encode_value(*shape, std::string("Lorentz")), "LOR");
  EXPECT_EQ(*shape->default_value, "PULS");
}

TEST(InstrumentModelsTest, AfgTriggerTimeRange) {
  auto schema = models::make_afg31000_schema();
  auto trigger = schema.find_device_parameter("triggerTime");
  ASSERT_NE(trigger, nullptr);
  EXPECT_EQ(Codec::encode(*trigger, std::nullopt, 10.0), "TRIG:TIM 10 s\n");
  EXPECT_THROW(Codec::encode_value(*trigger, 501.0), CodecError);
}

TEST(InstrumentModelsTest, AfgBurstDelayAllowsSymbolicValue) {
  auto schema = models::make_afg31000_schema();
  auto delay = schema.find_channel("2")->find("burstDelay");
  EXPECT_EQ(Codec::encode(*delay, std::string("2"), std::string("MIN")),
            "SOURce2:BURS:TDEL MIN s\n");
}

TEST(InstrumentModelsTest, Keysight3500SkipsReadBack) {
  auto schema = models::make_keysight_3500_schema();
  ASSERT_EQ(schema.channels().size(), 2u);
  EXPECT_EQ(schema.channels()[0].name, "keysight_ch_1");
  for (const auto &p : schema.channels()[0].parameters)
    EXPECT_FALSE(p.command_read_back) << p.key;
}

TEST(InstrumentModelsTest, LoadFormIsWriteOnly) {
  auto schema = models::make_keysight_33512_schema();
  auto load = schema.find_channel("1")->find("loadForm");
  ASSERT_NE(load, nullptr);
  EXPECT_FALSE(load->read_on_connect);
  EXPECT_FALSE(load->command_read_back);
}

TEST(InstrumentModelsTest, DisplayIsForcedOffOnConnect) {
  auto schema = models::make_keysight_33512_schema();
  auto display = schema.find_device_parameter("display");
  EXPECT_TRUE(display->write_on_connect);
  EXPECT_FALSE(display->read_on_connect);
  EXPECT_EQ(*display->default_value, "OFF");
}

TEST(InstrumentModelsTest, EveryOfferedShapeNameRoundTrips) {
  for (const auto &model : models::available_models()) {
    auto schema = models::make_schema(model);
    size_t checked = 0;
    for (const auto &node : schema.channels()) {
      auto shape = node.find("functionShape");
      if (!shape)
        continue;
      for (const auto &entry : models::function_shape_table()) {
        const std::string &name = entry.first;
        if (shape->encode_map.count(name) == 0) {
          EXPECT_THROW(Codec::encode_value(*shape, name), CodecError)
              << model << " " << name;
          continue;
        }
        std::string token = Codec::encode_value(*shape, name);
        EXPECT_EQ(token, entry.second) << model << " " << name;
        EXPECT_EQ(Codec::decode(*shape, token), TypedValue(name))
            << model << " " << name;
        checked++;
      }
    }
    EXPECT_GT(checked, 0u) << model;
  }
}
