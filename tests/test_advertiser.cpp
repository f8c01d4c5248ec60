#include "core/advertiser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "advertising/advertisement.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <stdexcept>

using namespace blueadv;
using bluez::CallResult;

namespace
{
    /**
     * Records calls in order and replays scripted results
     */
    class FakeBackend : public bluez::IAdvertisingBackend
    {
    public:
        struct Script
        {
            CallResult connect;
            CallResult export_result;
            CallResult request_name;
            CallResult managed_objects;
            CallResult powered;
            CallResult register_result;
            CallResult unregister = CallResult::failure("org.bluez.Error.DoesNotExist", "Does Not Exist");
            nlohmann::json objects = nlohmann::json::parse(R"({
                "/org/bluez/hci0": {
                    "org.bluez.Adapter1": {},
                    "org.bluez.LEAdvertisingManager1": {}
                }
            })");
        };

        explicit FakeBackend(Script &script, std::vector<std::string> &calls)
            : script_(script), calls_(calls) {}

        CallResult connect() override
        {
            calls_.push_back("connect");
            connected_ = script_.connect.ok;
            return script_.connect;
        }

        bool is_connected() const override { return connected_; }

        CallResult export_advertisement(advertising::Advertisement &adv) override
        {
            calls_.push_back("export " + adv.object_path());
            exported = &adv;
            return script_.export_result;
        }

        void unexport_advertisement() override
        {
            calls_.push_back("unexport");
            exported = nullptr;
        }

        CallResult request_name(const std::string &bus_name) override
        {
            calls_.push_back("request_name " + bus_name);
            return script_.request_name;
        }

        CallResult get_managed_objects(nlohmann::json &objects) override
        {
            calls_.push_back("get_managed_objects");
            if (during_managed_objects)
            {
                during_managed_objects();
            }
            objects = script_.objects;
            return script_.managed_objects;
        }

        CallResult set_adapter_powered(const std::string &adapter_path, bool) override
        {
            calls_.push_back("power " + adapter_path);
            return script_.powered;
        }

        CallResult register_advertisement(const std::string &adapter_path, const std::string &object_path) override
        {
            calls_.push_back("register " + adapter_path + " " + object_path);
            return script_.register_result;
        }

        CallResult unregister_advertisement(const std::string &adapter_path, const std::string &object_path) override
        {
            calls_.push_back("unregister " + adapter_path + " " + object_path);
            return script_.unregister;
        }

        void run() override
        {
            calls_.push_back("run");
            // Simulates BlueZ releasing the advertisement while the loop runs
            if (release_during_run && exported)
            {
                exported->release();
            }
        }

        void quit() override
        {
            calls_.push_back("quit");
        }

        advertising::Advertisement *exported = nullptr;
        bool release_during_run = false;
        // Stands in for main loop callbacks dispatched while a call is pending
        std::function<void()> during_managed_objects;

    private:
        Script &script_;
        std::vector<std::string> &calls_;
        bool connected_ = false;
    };

    class AdvertiserTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            core::setup_logging(core::LogLevel::CRITICAL, "", false);
            config_ = core::AdvertiserConfig::create_default();
        }

        std::unique_ptr<core::Advertiser> make_advertiser()
        {
            auto backend = std::make_unique<FakeBackend>(script_, calls_);
            backend_ = backend.get();
            return std::make_unique<core::Advertiser>(std::move(config_), std::move(backend));
        }

        std::unique_ptr<core::AdvertiserConfig> config_;
        FakeBackend::Script script_;
        std::vector<std::string> calls_;
        FakeBackend *backend_ = nullptr;
    };

    const std::string PATH = "/org/bluez/advertisement/test1";
}

TEST_F(AdvertiserTest, RejectsNullArguments)
{
    EXPECT_THROW(core::Advertiser(nullptr, std::make_unique<FakeBackend>(script_, calls_)), std::invalid_argument);
    EXPECT_THROW(core::Advertiser(core::AdvertiserConfig::create_default(), nullptr), std::invalid_argument);
}

TEST_F(AdvertiserTest, RegistersInOrder)
{
    auto advertiser = make_advertiser();
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::IDLE);

    ASSERT_TRUE(advertiser->start());
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::REGISTERED);
    EXPECT_TRUE(advertiser->is_running());
    EXPECT_EQ(advertiser->adapter_path(), "/org/bluez/hci0");

    std::vector<std::string> expected{
        "connect",
        "export " + PATH,
        "get_managed_objects",
        "unregister /org/bluez/hci0 " + PATH,
        "register /org/bluez/hci0 " + PATH};
    EXPECT_EQ(calls_, expected);
}

TEST_F(AdvertiserTest, OptionalStepsWhenConfigured)
{
    config_->adapter.bus_name = "org.example.blueadv";
    config_->adapter.power_on = true;
    script_.request_name = CallResult::failure("org.freedesktop.DBus.Error.AccessDenied", "denied");
    script_.powered = CallResult::failure("org.bluez.Error.Failed", "rfkill");

    auto advertiser = make_advertiser();
    // Neither failure is fatal
    ASSERT_TRUE(advertiser->start());

    std::vector<std::string> expected{
        "connect",
        "export " + PATH,
        "request_name org.example.blueadv",
        "get_managed_objects",
        "power /org/bluez/hci0",
        "unregister /org/bluez/hci0 " + PATH,
        "register /org/bluez/hci0 " + PATH};
    EXPECT_EQ(calls_, expected);
}

TEST_F(AdvertiserTest, RegisterFailureIsReported)
{
    script_.register_result = CallResult::failure("org.bluez.Error.AlreadyExists", "Already Exists");

    auto advertiser = make_advertiser();
    EXPECT_FALSE(advertiser->start());
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::FAILED);
    EXPECT_EQ(advertiser->last_error().error_name, "org.bluez.Error.AlreadyExists");

    calls_.clear();
    advertiser->stop();
    // Never registered, so only the export is undone
    EXPECT_EQ(calls_, (std::vector<std::string>{"unexport", "quit"}));
}

TEST_F(AdvertiserTest, ConnectFailureStopsEarly)
{
    script_.connect = CallResult::failure("org.freedesktop.DBus.Error.NoServer", "no bus");

    auto advertiser = make_advertiser();
    EXPECT_FALSE(advertiser->start());
    EXPECT_EQ(calls_, (std::vector<std::string>{"connect"}));
    EXPECT_EQ(advertiser->last_error().error_message, "no bus");
}

TEST_F(AdvertiserTest, FallsBackToHci0WithoutManager)
{
    script_.objects = nlohmann::json::object();

    auto advertiser = make_advertiser();
    ASSERT_TRUE(advertiser->start());
    EXPECT_EQ(advertiser->adapter_path(), "/org/bluez/hci0");
}

TEST_F(AdvertiserTest, PicksLastAdvertisingAdapter)
{
    script_.objects["/org/bluez/hci1"] = {{"org.bluez.LEAdvertisingManager1", nlohmann::json::object()}};

    auto advertiser = make_advertiser();
    ASSERT_TRUE(advertiser->start());
    EXPECT_EQ(advertiser->adapter_path(), "/org/bluez/hci1");
}

TEST_F(AdvertiserTest, MissingPreferredAdapterIsFatal)
{
    config_->adapter.name = "hci3";

    auto advertiser = make_advertiser();
    EXPECT_FALSE(advertiser->start());
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::FAILED);
    EXPECT_EQ(calls_.back(), "get_managed_objects");
}

TEST_F(AdvertiserTest, StopUnregistersOnce)
{
    auto advertiser = make_advertiser();
    ASSERT_TRUE(advertiser->start());

    calls_.clear();
    advertiser->stop();
    advertiser->stop();

    std::vector<std::string> expected{"unregister /org/bluez/hci0 " + PATH, "unexport", "quit"};
    EXPECT_EQ(calls_, expected);
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::STOPPED);
}

TEST_F(AdvertiserTest, StopBeforeStartIsSafe)
{
    auto advertiser = make_advertiser();
    advertiser->stop();
    EXPECT_EQ(calls_, (std::vector<std::string>{"quit"}));
    EXPECT_FALSE(advertiser->start());
}

TEST_F(AdvertiserTest, RunIsSkippedUnlessRegistered)
{
    auto advertiser = make_advertiser();
    advertiser->run();
    EXPECT_TRUE(calls_.empty());
}

TEST_F(AdvertiserTest, ReleaseQuitsWhenConfigured)
{
    config_->session.exit_on_release = true;

    auto advertiser = make_advertiser();
    backend_->release_during_run = true;
    ASSERT_TRUE(advertiser->start());

    calls_.clear();
    advertiser->run();
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::RELEASED);
    EXPECT_TRUE(advertiser->advertisement().released());
    EXPECT_EQ(calls_, (std::vector<std::string>{"run", "quit"}));

    calls_.clear();
    advertiser->stop();
    // BlueZ already dropped a released advertisement
    EXPECT_EQ(calls_, (std::vector<std::string>{"unexport", "quit"}));
}

TEST_F(AdvertiserTest, ReleaseKeepsServingByDefault)
{
    auto advertiser = make_advertiser();
    backend_->release_during_run = true;
    ASSERT_TRUE(advertiser->start());

    calls_.clear();
    advertiser->run();
    EXPECT_EQ(advertiser->state(), core::Advertiser::State::RELEASED);
    EXPECT_EQ(calls_, (std::vector<std::string>{"run"}));
}

TEST_F(AdvertiserTest, AdvertisementBuiltFromConfig)
{
    config_->advertisement.local_name = "FromConfig";
    config_->advertisement.object_path = "/com/example/adv";

    auto advertiser = make_advertiser();
    EXPECT_EQ(advertiser->advertisement().local_name(), "FromConfig");
    ASSERT_TRUE(advertiser->start());
    EXPECT_EQ(calls_[1], "export /com/example/adv");
}

TEST_F(AdvertiserTest, RegistrationIsPrintedAtDefaultLevel)
{
    core::setup_logging(core::LogLevel::WARNING, "", false);
    auto advertiser = make_advertiser();

    ::testing::internal::CaptureStdout();
    bool started = advertiser->start();
    std::string output = ::testing::internal::GetCapturedStdout();

    ASSERT_TRUE(started);
    EXPECT_NE(output.find("Advertisement registered"), std::string::npos);
}

TEST_F(AdvertiserTest, RegisterFailureIsNotReportedAsRegistered)
{
    script_.register_result = CallResult::failure("org.bluez.Error.Failed", "Failed");
    auto advertiser = make_advertiser();

    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(advertiser->start());
    EXPECT_EQ(::testing::internal::GetCapturedStdout().find("Advertisement registered"), std::string::npos);
}

TEST_F(AdvertiserTest, StopRequestedDuringStartupSkipsRegistration)
{
    auto advertiser = make_advertiser();
    backend_->during_managed_objects = [&advertiser]()
    { advertiser->request_stop(); };

    EXPECT_FALSE(advertiser->start());
    EXPECT_TRUE(advertiser->stop_requested());
    EXPECT_NE(advertiser->state(), core::Advertiser::State::FAILED);

    std::vector<std::string> expected{
        "connect",
        "export " + PATH,
        "get_managed_objects",
        "quit"};
    EXPECT_EQ(calls_, expected);

    calls_.clear();
    advertiser->run();
    advertiser->stop();
    // Nothing was registered, so only the export is undone
    EXPECT_EQ(calls_, (std::vector<std::string>{"unexport", "quit"}));
}

TEST_F(AdvertiserTest, StopRequestedWhileServing)
{
    auto advertiser = make_advertiser();
    ASSERT_TRUE(advertiser->start());

    advertiser->request_stop();
    advertiser->request_stop();
    calls_.clear();
    advertiser->run();
    advertiser->stop();

    std::vector<std::string> expected{"unregister /org/bluez/hci0 " + PATH, "unexport", "quit"};
    EXPECT_EQ(calls_, expected);
}

TEST(AdvertiserStateTest, Names)
{
    EXPECT_EQ(core::state_to_string(core::Advertiser::State::REGISTERED), "registered");
    EXPECT_EQ(core::state_to_string(core::Advertiser::State::FAILED), "failed");
}
