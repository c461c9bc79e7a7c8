// test/types/test_configurations/driver_configuration_test.cpp
#include <gtest/gtest.h>

#include "types/configurations/driver_configuration.hpp"

namespace subghz {
namespace test {

TEST(DriverConfigTest, DefaultsAreValid) {
    DriverConfig config = DriverConfig::CreateDefault();
    EXPECT_TRUE(config.IsValid());
    EXPECT_EQ(config.getBusyTimeoutMs(), 100u);
    EXPECT_EQ(config.getPollIntervalMs(), 1u);
    EXPECT_EQ(config.getBufferCapacity(), 256u);
}

TEST(DriverConfigTest, ConstructorRejectsInvalidValues) {
    EXPECT_THROW(DriverConfig(0), std::invalid_argument);
    EXPECT_THROW(DriverConfig(100, 1, 257), std::invalid_argument);
    EXPECT_NO_THROW(DriverConfig(100, 0, 0));
}

TEST(DriverConfigTest, SettersValidateInput) {
    DriverConfig config;
    EXPECT_THROW(config.setBusyTimeoutMs(0), std::invalid_argument);
    EXPECT_THROW(config.setBufferCapacity(512), std::invalid_argument);

    config.setBusyTimeoutMs(5);
    config.setBufferCapacity(128);
    EXPECT_EQ(config.getBusyTimeoutMs(), 5u);
    EXPECT_EQ(config.getBufferCapacity(), 128u);
    EXPECT_TRUE(config.IsValid());
}

}  // namespace test
}  // namespace subghz
