#include "core/advertiser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "advertising/ad_payload.hpp"
#include "advertising/advertisement.hpp"
#include "bluez/constants.hpp"
#include "bluez/managed_objects.hpp"

#include <iostream>
#include <stdexcept>

namespace blueadv
{
    namespace core
    {

        std::string state_to_string(Advertiser::State state)
        {
            switch (state)
            {
            case Advertiser::State::IDLE:
                return "idle";
            case Advertiser::State::CONNECTED:
                return "connected";
            case Advertiser::State::EXPORTED:
                return "exported";
            case Advertiser::State::REGISTERED:
                return "registered";
            case Advertiser::State::RELEASED:
                return "released";
            case Advertiser::State::STOPPED:
                return "stopped";
            case Advertiser::State::FAILED:
                return "failed";
            }
            return "unknown";
        }

        Advertiser::Advertiser(std::unique_ptr<AdvertiserConfig> config,
                               std::unique_ptr<bluez::IAdvertisingBackend> backend)
            : config_(std::move(config)), backend_(std::move(backend)), logger_(get_logger("Advertiser"))
        {
            if (!config_)
            {
                throw std::invalid_argument("Advertiser configuration cannot be null");
            }
            if (!backend_)
            {
                throw std::invalid_argument("Advertiser backend cannot be null");
            }

            advertisement_ = advertising::Advertisement::from_config(config_->advertisement);
            advertisement_->set_release_callback([this]()
                                                 { on_release(); });

            logger_->debug("Advertiser initialized",
                           LogContext()
                               .add("object_path", advertisement_->object_path())
                               .add("type", advertising::type_to_string(advertisement_->type())));
        }

        Advertiser::~Advertiser()
        {
            stop();
        }

        bool Advertiser::start()
        {
            if (state_ != State::IDLE)
            {
                logger_->warning("Advertiser already started", LogContext().add("state", state_to_string(state_)));
                return state_ == State::REGISTERED;
            }

            log_payload_estimate();

            auto result = backend_->connect();
            if (!result.ok)
            {
                return fail("Failed to connect to the system bus", result);
            }
            state_ = State::CONNECTED;

            if (interrupted("export"))
            {
                return false;
            }

            result = backend_->export_advertisement(*advertisement_);
            if (!result.ok)
            {
                return fail("Failed to export advertisement", result);
            }
            exported_ = true;
            state_ = State::EXPORTED;

            const auto &bus_name = config_->adapter.bus_name;
            if (!bus_name.empty())
            {
                result = backend_->request_name(bus_name);
                if (!result.ok)
                {
                    logger_->warning("Could not acquire bus name",
                                     LogContext().add("name", bus_name).add("error", result.error_name).add("message", result.error_message));
                }
            }

            if (interrupted("adapter selection") || !select_adapter())
            {
                return false;
            }

            if (config_->adapter.power_on)
            {
                result = backend_->set_adapter_powered(adapter_path_, true);
                if (!result.ok)
                {
                    logger_->warning("Failed to power on adapter",
                                     LogContext().add("adapter", adapter_path_).add("error", result.error_name).add("message", result.error_message));
                }
            }

            if (interrupted("registration"))
            {
                return false;
            }

            // Clears a stale registration left by a previous run
            const auto &path = advertisement_->object_path();
            result = backend_->unregister_advertisement(adapter_path_, path);
            if (!result.ok)
            {
                logger_->debug("Stale registration cleanup skipped",
                               LogContext().add("error", result.error_name).add("message", result.error_message));
            }

            result = backend_->register_advertisement(adapter_path_, path);
            if (!result.ok)
            {
                return fail("Failed to register advertisement", result);
            }

            state_ = State::REGISTERED;
            std::cout << "Advertisement registered" << std::endl;
            logger_->info("Advertisement registered", LogContext().add("adapter", adapter_path_).add("path", path));
            return true;
        }

        void Advertiser::run()
        {
            if (stop_requested_ || (state_ != State::REGISTERED && state_ != State::RELEASED))
            {
                return;
            }
            backend_->run();
        }

        void Advertiser::stop()
        {
            if (state_ == State::STOPPED)
            {
                return;
            }

            if (state_ == State::REGISTERED)
            {
                auto result = backend_->unregister_advertisement(adapter_path_, advertisement_->object_path());
                if (result.ok)
                {
                    logger_->info("Advertisement unregistered", LogContext().add("adapter", adapter_path_));
                }
                else
                {
                    logger_->warning("Failed to unregister advertisement",
                                     LogContext().add("error", result.error_name).add("message", result.error_message));
                }
            }

            if (exported_)
            {
                backend_->unexport_advertisement();
                exported_ = false;
            }

            backend_->quit();
            state_ = State::STOPPED;
            logger_->debug("Advertiser stopped");
        }

        void Advertiser::request_stop()
        {
            if (stop_requested_)
            {
                return;
            }

            stop_requested_ = true;
            logger_->info("Stop requested", LogContext().add("state", state_to_string(state_)));
            backend_->quit();
        }

        bool Advertiser::interrupted(const char *step)
        {
            if (!stop_requested_)
            {
                return false;
            }

            logger_->info("Startup interrupted", LogContext().add("before", step));
            return true;
        }

        bool Advertiser::fail(const std::string &message, const bluez::CallResult &result)
        {
            last_error_ = result;
            state_ = State::FAILED;
            logger_->error(message, LogContext().add("error", result.error_name).add("message", result.error_message));
            return false;
        }

        bool Advertiser::select_adapter()
        {
            nlohmann::json objects;
            auto result = backend_->get_managed_objects(objects);
            if (!result.ok)
            {
                return fail("Failed to query BlueZ objects", result);
            }

            const auto &preferred = config_->adapter.name;
            auto selection = bluez::select_advertising_adapter(objects, preferred);

            if (!selection.found)
            {
                if (!preferred.empty())
                {
                    return fail("Adapter does not support advertising",
                                bluez::CallResult::failure(bluez::ERROR_DOES_NOT_EXIST,
                                                           "No LEAdvertisingManager1 on " + selection.path));
                }
                logger_->warning("LEAdvertisingManager1 interface not found, falling back",
                                 LogContext().add("adapter", selection.path));
            }

            adapter_path_ = selection.path;
            logger_->info("Using adapter", LogContext().add("adapter", adapter_path_));
            return true;
        }

        void Advertiser::log_payload_estimate()
        {
            auto structures = advertising::encode_advertising_data(*advertisement_);
            auto size = advertising::payload_size(structures);

            logger_->debug("Estimated advertising payload",
                           LogContext().add("bytes", size).add("data", advertising::to_hex(structures)));

            if (!advertising::fits_legacy_payload(structures))
            {
                logger_->warning("Advertising data may exceed the legacy payload limit",
                                 LogContext().add("bytes", size).add("limit", advertising::LEGACY_PAYLOAD_LIMIT));
            }
        }

        void Advertiser::on_release()
        {
            state_ = State::RELEASED;
            if (config_->session.exit_on_release)
            {
                logger_->info("Advertisement released by BlueZ, exiting");
                backend_->quit();
            }
        }

    } // namespace core
} // namespace blueadv
