#ifndef BLUEADV_CORE_CONFIG_HPP
#define BLUEADV_CORE_CONFIG_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace blueadv
{
    namespace core
    {

        /**
         * Contents of the exported org.bluez.LEAdvertisement1 object
         */
        struct AdvertisementConfig
        {
            std::string type = "broadcast";
            std::string local_name = "TestAdvertisement";
            std::vector<std::string> service_uuids{"ABCD"};
            std::vector<std::string> solicit_uuids;
            std::map<uint16_t, std::vector<uint8_t>> manufacturer_data{{0x0123, {1, 2, 3, 4, 5}}};
            std::map<std::string, std::vector<uint8_t>> service_data;
            std::optional<uint16_t> appearance;
            std::vector<std::string> includes;
            int timeout = 0;
            int duration = 0;
            std::string object_path = "/org/bluez/advertisement/test1";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Which adapter to advertise on and how to prepare it
         */
        struct AdapterConfig
        {
            std::string name;     // "hci1" or "/org/bluez/hci1"; empty picks automatically
            bool power_on = false;
            std::string bus_name; // Well-known name requested on the system bus; empty skips it

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct SessionConfig
        {
            bool exit_on_release = false;
            int call_timeout_ms = 5000;
            std::string bus_address; // D-Bus address such as "unix:path=..."; empty uses the system bus

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete advertiser configuration
         */
        class AdvertiserConfig
        {
        public:
            AdvertisementConfig advertisement;
            AdapterConfig adapter;
            LoggingConfig logging;
            SessionConfig session;

        public:
            AdvertiserConfig() = default;

            static std::unique_ptr<AdvertiserConfig> from_file(const std::string &config_path);
            static std::unique_ptr<AdvertiserConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<AdvertiserConfig> create_default();

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Empty when the configuration is usable
            std::vector<std::string> validation_errors() const;
            bool validate() const;
        };

    } // namespace core
} // namespace blueadv

#endif // BLUEADV_CORE_CONFIG_HPP
