#include "advertising/advertisement.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace blueadv
{
    namespace advertising
    {

        std::string type_to_string(AdvertisementType type)
        {
            switch (type)
            {
            case AdvertisementType::BROADCAST:
                return "broadcast";
            case AdvertisementType::PERIPHERAL:
                return "peripheral";
            }
            return "broadcast";
        }

        AdvertisementType type_from_string(const std::string &text)
        {
            if (text == "broadcast")
                return AdvertisementType::BROADCAST;
            if (text == "peripheral")
                return AdvertisementType::PERIPHERAL;
            throw std::invalid_argument("Unknown advertisement type: " + text);
        }

        Advertisement::Advertisement(const std::string &object_path)
            : object_path_(object_path), logger_(core::get_logger("Advertisement"))
        {
        }

        std::unique_ptr<Advertisement> Advertisement::from_config(const core::AdvertisementConfig &config)
        {
            auto adv = std::make_unique<Advertisement>(config.object_path);

            adv->set_type(config.type);
            adv->set_service_uuids(config.service_uuids);
            adv->set_solicit_uuids(config.solicit_uuids);
            adv->set_manufacturer_data(config.manufacturer_data);
            adv->set_service_data(config.service_data);
            adv->set_local_name(config.local_name);
            adv->set_appearance(config.appearance);
            adv->set_includes(config.includes);

            if (config.timeout < 0 || config.timeout > 0xFFFF || config.duration < 0 || config.duration > 0xFFFF)
            {
                throw std::invalid_argument("Advertisement timeout and duration must fit in 16 bits");
            }
            adv->set_timeout(static_cast<uint16_t>(config.timeout));
            adv->set_duration(static_cast<uint16_t>(config.duration));

            return adv;
        }

        void Advertisement::set_type(AdvertisementType type)
        {
            type_ = type;
        }

        void Advertisement::set_type(const std::string &type)
        {
            type_ = type_from_string(type);
        }

        void Advertisement::add_service_uuid(const std::string &uuid)
        {
            BluetoothUuid::parse(uuid);
            service_uuids_.push_back(uuid);
        }

        void Advertisement::set_service_uuids(const std::vector<std::string> &uuids)
        {
            for (const auto &uuid : uuids)
            {
                BluetoothUuid::parse(uuid);
            }
            service_uuids_ = uuids;
        }

        void Advertisement::add_solicit_uuid(const std::string &uuid)
        {
            BluetoothUuid::parse(uuid);
            solicit_uuids_.push_back(uuid);
        }

        void Advertisement::set_solicit_uuids(const std::vector<std::string> &uuids)
        {
            for (const auto &uuid : uuids)
            {
                BluetoothUuid::parse(uuid);
            }
            solicit_uuids_ = uuids;
        }

        void Advertisement::set_manufacturer_data(const std::map<uint16_t, Bytes> &data)
        {
            manufacturer_data_ = data;
        }

        void Advertisement::set_service_data(const std::map<std::string, Bytes> &data)
        {
            for (const auto &entry : data)
            {
                BluetoothUuid::parse(entry.first);
            }
            service_data_ = data;
        }

        void Advertisement::set_local_name(const std::string &name)
        {
            local_name_ = name;
        }

        void Advertisement::set_appearance(std::optional<uint16_t> appearance)
        {
            appearance_ = appearance;
        }

        void Advertisement::set_includes(const std::vector<std::string> &includes)
        {
            static const std::set<std::string> known{"tx-power", "appearance", "local-name"};
            for (const auto &include : includes)
            {
                if (known.count(include) == 0)
                {
                    throw std::invalid_argument("Unknown advertisement include: " + include);
                }
            }
            includes_ = includes;
        }

        std::vector<std::string> Advertisement::exposed_properties() const
        {
            std::vector<std::string> names{
                property::TYPE,
                property::SERVICE_UUIDS,
                property::MANUFACTURER_DATA,
                property::LOCAL_NAME};

            if (!solicit_uuids_.empty())
                names.push_back(property::SOLICIT_UUIDS);
            if (!service_data_.empty())
                names.push_back(property::SERVICE_DATA);
            if (appearance_)
                names.push_back(property::APPEARANCE);
            if (!includes_.empty())
                names.push_back(property::INCLUDES);
            if (timeout_ > 0)
                names.push_back(property::TIMEOUT);
            if (duration_ > 0)
                names.push_back(property::DURATION);

            return names;
        }

        bool Advertisement::exposes(const std::string &property_name) const
        {
            auto names = exposed_properties();
            return std::find(names.begin(), names.end(), property_name) != names.end();
        }

        void Advertisement::release()
        {
            released_ = true;
            std::cout << object_path_ << ": Released!" << std::endl;
            logger_->info(object_path_ + ": Released!");

            if (release_callback_)
            {
                release_callback_();
            }
        }

    } // namespace advertising
} // namespace blueadv
