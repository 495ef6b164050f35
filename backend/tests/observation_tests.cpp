#include <gtest/gtest.h>
#include "core/Observation.hpp"
#include <cmath>
#include <limits>

using namespace airscope;

TEST(Observation, WifiPrefersSourceSsid) {
    auto obs = make_observation(DeviceType::Wifi, "aa-bb-cc-00-11-22", std::string("display"), -47.9, std::string("HomeNet"));
    ASSERT_TRUE(obs.has_value());
    const auto& w = std::get<WifiObservation>(*obs);
    EXPECT_EQ(w.mac, "AA:BB:CC:00:11:22");
    EXPECT_EQ(w.ssid, std::optional<std::string>("HomeNet"));
    EXPECT_EQ(w.signal_dbm, -47); // truncated toward zero
}

TEST(Observation, WifiFallsBackToDisplayName) {
    auto obs = make_observation(DeviceType::Wifi, "AA:BB:CC:00:11:22", std::string("Cafe"), -60.0);
    ASSERT_TRUE(obs.has_value());
    EXPECT_EQ(std::get<WifiObservation>(*obs).ssid, std::optional<std::string>("Cafe"));
}

TEST(Observation, BleCarriesName) {
    auto obs = make_observation(DeviceType::Ble, "11:22:33:44:55:66", std::string("Tag"), -80.0, std::string("ignored"));
    ASSERT_TRUE(obs.has_value());
    EXPECT_EQ(observation_type(*obs), DeviceType::Ble);
    EXPECT_EQ(std::get<BleObservation>(*obs).name, std::optional<std::string>("Tag"));
    EXPECT_EQ(observation_signal(*obs), -80);
    EXPECT_EQ(observation_mac(*obs), "11:22:33:44:55:66");
}

TEST(Observation, RejectsIncompleteInput) {
    EXPECT_FALSE(make_observation(DeviceType::Wifi, "", std::string("x"), -50.0).has_value());
    EXPECT_FALSE(make_observation(DeviceType::Wifi, "  ", std::string("x"), -50.0).has_value());
    EXPECT_FALSE(make_observation(DeviceType::Ble, "11:22:33:44:55:66", std::nullopt, std::nullopt).has_value());
    EXPECT_FALSE(make_observation(DeviceType::Ble, "11:22:33:44:55:66", std::nullopt,
                                  std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(Observation, TypeNamesRoundTrip) {
    EXPECT_STREQ(to_string(DeviceType::Wifi), "wifi");
    EXPECT_STREQ(to_string(DeviceType::Ble), "ble");
    EXPECT_EQ(device_type_from_string("ble"), DeviceType::Ble);
    EXPECT_FALSE(device_type_from_string("zigbee").has_value());
}

TEST(Observation, RejectsSignalOutsideIntRange) {
    EXPECT_FALSE(make_observation(DeviceType::Ble, "11:22:33:44:55:66", std::string("x"), 1e12).has_value());
    EXPECT_FALSE(make_observation(DeviceType::Wifi, "11:22:33:44:55:66", std::string("x"), -1e12).has_value());
    EXPECT_FALSE(make_observation(DeviceType::Wifi, "11:22:33:44:55:66", std::string("x"),
                                  std::numeric_limits<double>::infinity()).has_value());

    auto edge = make_observation(DeviceType::Ble, "11:22:33:44:55:66", std::nullopt,
                                 (double)std::numeric_limits<int>::min());
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(observation_signal(*edge), std::numeric_limits<int>::min());
}
