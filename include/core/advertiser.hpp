#ifndef BLUEADV_CORE_ADVERTISER_HPP
#define BLUEADV_CORE_ADVERTISER_HPP

#include "bluez/advertising_backend.hpp"

#include <memory>
#include <string>

namespace blueadv
{
    namespace advertising
    {
        class Advertisement;
    }

    namespace core
    {
        class AdvertiserConfig;
        class Logger;

        /**
         * Advertising session orchestrator
         * Exports the advertisement, picks an adapter and registers with BlueZ
         */
        class Advertiser
        {
        public:
            enum class State
            {
                IDLE,
                CONNECTED,
                EXPORTED,
                REGISTERED,
                RELEASED,
                STOPPED,
                FAILED
            };

            Advertiser(std::unique_ptr<AdvertiserConfig> config,
                       std::unique_ptr<bluez::IAdvertisingBackend> backend);
            ~Advertiser();

            Advertiser(const Advertiser &) = delete;
            Advertiser &operator=(const Advertiser &) = delete;

            // Session lifecycle
            bool start();
            void run();
            void stop();
            bool is_running() const { return state_ == State::REGISTERED; }

            // Safe from a main loop callback while start() is waiting on BlueZ
            void request_stop();
            bool stop_requested() const { return stop_requested_; }

            State state() const { return state_; }
            const std::string &adapter_path() const { return adapter_path_; }
            const bluez::CallResult &last_error() const { return last_error_; }

            advertising::Advertisement &advertisement() { return *advertisement_; }
            const AdvertiserConfig &config() const { return *config_; }

        private:
            bool fail(const std::string &message, const bluez::CallResult &result);
            bool interrupted(const char *step);
            bool select_adapter();
            void log_payload_estimate();
            void on_release();

            std::unique_ptr<AdvertiserConfig> config_;
            std::unique_ptr<bluez::IAdvertisingBackend> backend_;
            std::unique_ptr<advertising::Advertisement> advertisement_;
            std::shared_ptr<Logger> logger_;

            State state_ = State::IDLE;
            bool exported_ = false;
            bool stop_requested_ = false;
            std::string adapter_path_;
            bluez::CallResult last_error_;
        };

        std::string state_to_string(Advertiser::State state);

    } // namespace core
} // namespace blueadv

#endif // BLUEADV_CORE_ADVERTISER_HPP
