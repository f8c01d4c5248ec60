#ifndef BLUEADV_ADVERTISING_ADVERTISEMENT_HPP
#define BLUEADV_ADVERTISING_ADVERTISEMENT_HPP

#include "advertising/bytes.hpp"
#include "advertising/uuid.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blueadv
{
    namespace core
    {
        struct AdvertisementConfig;
        class Logger;
    }

    namespace advertising
    {
        enum class AdvertisementType
        {
            BROADCAST,
            PERIPHERAL
        };

        std::string type_to_string(AdvertisementType type);
        AdvertisementType type_from_string(const std::string &text);

        // org.bluez.LEAdvertisement1 property names
        namespace property
        {
            constexpr const char *TYPE = "Type";
            constexpr const char *SERVICE_UUIDS = "ServiceUUIDs";
            constexpr const char *SOLICIT_UUIDS = "SolicitUUIDs";
            constexpr const char *MANUFACTURER_DATA = "ManufacturerData";
            constexpr const char *SERVICE_DATA = "ServiceData";
            constexpr const char *LOCAL_NAME = "LocalName";
            constexpr const char *APPEARANCE = "Appearance";
            constexpr const char *INCLUDES = "Includes";
            constexpr const char *TIMEOUT = "Timeout";
            constexpr const char *DURATION = "Duration";
        }

        constexpr const char *DEFAULT_OBJECT_PATH = "/org/bluez/advertisement/test1";

        /**
         * Model behind the exported LEAdvertisement1 object.
         *
         * Accessed only from the D-Bus main loop thread.
         */
        class Advertisement
        {
        public:
            using ReleaseCallback = std::function<void()>;

            explicit Advertisement(const std::string &object_path = DEFAULT_OBJECT_PATH);

            static std::unique_ptr<Advertisement> from_config(const core::AdvertisementConfig &config);

            const std::string &object_path() const { return object_path_; }

            AdvertisementType type() const { return type_; }
            const std::vector<std::string> &service_uuids() const { return service_uuids_; }
            const std::vector<std::string> &solicit_uuids() const { return solicit_uuids_; }
            const std::map<uint16_t, Bytes> &manufacturer_data() const { return manufacturer_data_; }
            const std::map<std::string, Bytes> &service_data() const { return service_data_; }
            const std::string &local_name() const { return local_name_; }
            const std::optional<uint16_t> &appearance() const { return appearance_; }
            const std::vector<std::string> &includes() const { return includes_; }
            uint16_t timeout() const { return timeout_; }
            uint16_t duration() const { return duration_; }

            void set_type(AdvertisementType type);
            void set_type(const std::string &type);
            void add_service_uuid(const std::string &uuid);
            void set_service_uuids(const std::vector<std::string> &uuids);
            void add_solicit_uuid(const std::string &uuid);
            void set_solicit_uuids(const std::vector<std::string> &uuids);
            void set_manufacturer_data(const std::map<uint16_t, Bytes> &data);
            void set_service_data(const std::map<std::string, Bytes> &data);
            void set_local_name(const std::string &name);
            void set_appearance(std::optional<uint16_t> appearance);
            void set_includes(const std::vector<std::string> &includes);
            void set_timeout(uint16_t seconds) { timeout_ = seconds; }
            void set_duration(uint16_t seconds) { duration_ = seconds; }

            // Properties present on the bus; optional ones appear once set
            std::vector<std::string> exposed_properties() const;
            bool exposes(const std::string &property_name) const;

            void set_release_callback(ReleaseCallback callback) { release_callback_ = std::move(callback); }

            // Invoked when BlueZ calls Release on the object
            void release();
            bool released() const { return released_; }
            void reset_released() { released_ = false; }

        private:
            std::string object_path_;
            AdvertisementType type_ = AdvertisementType::BROADCAST;
            std::vector<std::string> service_uuids_{"ABCD"};
            std::vector<std::string> solicit_uuids_;
            std::map<uint16_t, Bytes> manufacturer_data_{{0x0123, {1, 2, 3, 4, 5}}};
            std::map<std::string, Bytes> service_data_;
            std::string local_name_ = "TestAdvertisement";
            std::optional<uint16_t> appearance_;
            std::vector<std::string> includes_;
            uint16_t timeout_ = 0;
            uint16_t duration_ = 0;

            bool released_ = false;
            ReleaseCallback release_callback_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace advertising
} // namespace blueadv

#endif // BLUEADV_ADVERTISING_ADVERTISEMENT_HPP
