#include "advertising/advertisement.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace blueadv::advertising;

namespace
{
    class AdvertisementTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            blueadv::core::setup_logging(blueadv::core::LogLevel::CRITICAL, "", false);
        }
    };

    bool contains(const std::vector<std::string> &names, const std::string &name)
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }
}

TEST_F(AdvertisementTest, DefaultContent)
{
    Advertisement adv;

    EXPECT_EQ(adv.object_path(), "/org/bluez/advertisement/test1");
    EXPECT_EQ(adv.type(), AdvertisementType::BROADCAST);
    EXPECT_EQ(adv.service_uuids(), (std::vector<std::string>{"ABCD"}));
    EXPECT_EQ(adv.manufacturer_data().at(0x0123), (Bytes{1, 2, 3, 4, 5}));
    EXPECT_EQ(adv.local_name(), "TestAdvertisement");
    EXPECT_FALSE(adv.appearance().has_value());
}

TEST_F(AdvertisementTest, MandatoryPropertiesAlwaysExposed)
{
    Advertisement adv;
    auto names = adv.exposed_properties();

    EXPECT_EQ(names.size(), 4u);
    EXPECT_TRUE(contains(names, property::TYPE));
    EXPECT_TRUE(contains(names, property::SERVICE_UUIDS));
    EXPECT_TRUE(contains(names, property::MANUFACTURER_DATA));
    EXPECT_TRUE(contains(names, property::LOCAL_NAME));
    EXPECT_FALSE(adv.exposes(property::APPEARANCE));
}

TEST_F(AdvertisementTest, OptionalPropertiesAppearOnceSet)
{
    Advertisement adv;
    adv.set_appearance(0x0341);
    adv.set_includes({"tx-power"});
    adv.set_timeout(30);
    adv.add_solicit_uuid("180D");
    adv.set_service_data({{"FEAA", {0x10}}});

    EXPECT_TRUE(adv.exposes(property::APPEARANCE));
    EXPECT_TRUE(adv.exposes(property::INCLUDES));
    EXPECT_TRUE(adv.exposes(property::TIMEOUT));
    EXPECT_TRUE(adv.exposes(property::SOLICIT_UUIDS));
    EXPECT_TRUE(adv.exposes(property::SERVICE_DATA));
    EXPECT_FALSE(adv.exposes(property::DURATION));
}

TEST_F(AdvertisementTest, AddServiceUuidAppends)
{
    Advertisement adv;
    adv.add_service_uuid("180F");
    EXPECT_EQ(adv.service_uuids(), (std::vector<std::string>{"ABCD", "180F"}));
}

TEST_F(AdvertisementTest, ManufacturerDataIsReplaced)
{
    Advertisement adv;
    adv.set_manufacturer_data({{0x004C, {0x02, 0x15}}});
    EXPECT_EQ(adv.manufacturer_data().size(), 1u);
    EXPECT_EQ(adv.manufacturer_data().count(0x0123), 0u);
}

TEST_F(AdvertisementTest, SettersValidateInput)
{
    Advertisement adv;
    EXPECT_THROW(adv.add_service_uuid("nope"), std::invalid_argument);
    EXPECT_THROW(adv.set_type("scanner"), std::invalid_argument);
    EXPECT_THROW(adv.set_includes({"rssi"}), std::invalid_argument);
    EXPECT_THROW(adv.set_service_data({{"bad", {}}}), std::invalid_argument);

    // Rejected writes leave the model untouched
    EXPECT_EQ(adv.service_uuids().size(), 1u);
    EXPECT_EQ(adv.type(), AdvertisementType::BROADCAST);
}

TEST_F(AdvertisementTest, ReleaseInvokesCallback)
{
    Advertisement adv;
    int calls = 0;
    adv.set_release_callback([&calls]()
                             { ++calls; });

    EXPECT_FALSE(adv.released());
    adv.release();
    EXPECT_TRUE(adv.released());
    EXPECT_EQ(calls, 1);

    adv.reset_released();
    EXPECT_FALSE(adv.released());
}

TEST_F(AdvertisementTest, ReleaseIsPrintedAtDefaultLevel)
{
    blueadv::core::setup_logging(blueadv::core::LogLevel::WARNING, "", false);
    Advertisement adv;

    ::testing::internal::CaptureStdout();
    adv.release();
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "/org/bluez/advertisement/test1: Released!\n");
}

TEST_F(AdvertisementTest, BuildsFromConfig)
{
    blueadv::core::AdvertisementConfig config;
    config.type = "peripheral";
    config.local_name = "Configured";
    config.service_uuids = {"180F", "6E400001-B5A3-F393-E0A9-E50E24DCCA9E"};
    config.duration = 5;
    config.object_path = "/com/example/adv0";

    auto adv = Advertisement::from_config(config);
    EXPECT_EQ(adv->object_path(), "/com/example/adv0");
    EXPECT_EQ(adv->type(), AdvertisementType::PERIPHERAL);
    EXPECT_EQ(adv->local_name(), "Configured");
    EXPECT_EQ(adv->service_uuids().size(), 2u);
    EXPECT_EQ(adv->duration(), 5);
    EXPECT_TRUE(adv->exposes(property::DURATION));

    config.timeout = -1;
    EXPECT_THROW(Advertisement::from_config(config), std::invalid_argument);
}

TEST(AdvertisementTypeTest, Conversions)
{
    EXPECT_EQ(type_to_string(AdvertisementType::PERIPHERAL), "peripheral");
    EXPECT_EQ(type_from_string("broadcast"), AdvertisementType::BROADCAST);
    EXPECT_THROW(type_from_string("Broadcast"), std::invalid_argument);
}
