#include "advertising/ad_payload.hpp"
#include "advertising/advertisement.hpp"
#include "advertising/uuid.hpp"

#include <algorithm>
#include <cstddef>

namespace blueadv
{
    namespace advertising
    {
        namespace
        {
            uint8_t list_type(size_t uuid_size, bool solicit)
            {
                switch (uuid_size)
                {
                case 2:
                    return solicit ? ad_type::SOLICIT_UUID16 : ad_type::COMPLETE_UUID16;
                case 4:
                    return solicit ? ad_type::SOLICIT_UUID32 : ad_type::COMPLETE_UUID32;
                default:
                    return solicit ? ad_type::SOLICIT_UUID128 : ad_type::COMPLETE_UUID128;
                }
            }

            uint8_t service_data_type(size_t uuid_size)
            {
                switch (uuid_size)
                {
                case 2:
                    return ad_type::SERVICE_DATA16;
                case 4:
                    return ad_type::SERVICE_DATA32;
                default:
                    return ad_type::SERVICE_DATA128;
                }
            }

            // One list per UUID width, 16-bit first; duplicates are collapsed
            void append_uuid_lists(const std::vector<std::string> &uuids, bool solicit,
                                   std::vector<AdStructure> &out)
            {
                std::vector<BluetoothUuid> seen;
                Bytes by_size[3];

                for (const auto &text : uuids)
                {
                    BluetoothUuid uuid = BluetoothUuid::parse(text);
                    if (std::find(seen.begin(), seen.end(), uuid) != seen.end())
                        continue;
                    seen.push_back(uuid);

                    size_t size = uuid.shortest_size();
                    Bytes &bucket = by_size[size == 2 ? 0 : (size == 4 ? 1 : 2)];
                    Bytes le = uuid.to_le_bytes(size);
                    bucket.insert(bucket.end(), le.begin(), le.end());
                }

                const size_t sizes[3] = {2, 4, 16};
                for (int i = 0; i < 3; ++i)
                {
                    if (!by_size[i].empty())
                        out.push_back(AdStructure{list_type(sizes[i], solicit), by_size[i]});
                }
            }

            bool includes(const Advertisement &adv, const std::string &name)
            {
                const auto &list = adv.includes();
                return std::find(list.begin(), list.end(), name) != list.end();
            }
        } // namespace

        std::vector<AdStructure> encode_advertising_data(const Advertisement &adv)
        {
            std::vector<AdStructure> out;

            if (adv.type() == AdvertisementType::PERIPHERAL)
            {
                out.push_back(AdStructure{ad_type::FLAGS, {PERIPHERAL_FLAGS}});
            }

            append_uuid_lists(adv.service_uuids(), false, out);
            append_uuid_lists(adv.solicit_uuids(), true, out);

            for (const auto &[text, payload] : adv.service_data())
            {
                BluetoothUuid uuid = BluetoothUuid::parse(text);
                size_t size = uuid.shortest_size();
                Bytes data = uuid.to_le_bytes(size);
                data.insert(data.end(), payload.begin(), payload.end());
                out.push_back(AdStructure{service_data_type(size), data});
            }

            for (const auto &[company, payload] : adv.manufacturer_data())
            {
                Bytes data{static_cast<uint8_t>(company & 0xFF), static_cast<uint8_t>(company >> 8)};
                data.insert(data.end(), payload.begin(), payload.end());
                out.push_back(AdStructure{ad_type::MANUFACTURER_DATA, data});
            }

            if (adv.appearance() || includes(adv, "appearance"))
            {
                // BlueZ substitutes the adapter appearance when none is given
                uint16_t value = adv.appearance().value_or(0);
                out.push_back(AdStructure{ad_type::APPEARANCE,
                                          {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>(value >> 8)}});
            }

            if (includes(adv, "tx-power"))
            {
                // Actual level is chosen by the controller
                out.push_back(AdStructure{ad_type::TX_POWER, {0x00}});
            }

            if (!adv.local_name().empty())
            {
                out.push_back(AdStructure{ad_type::COMPLETE_LOCAL_NAME,
                                          Bytes(adv.local_name().begin(), adv.local_name().end())});
            }

            return out;
        }

        size_t payload_size(const std::vector<AdStructure> &structures)
        {
            size_t total = 0;
            for (const auto &s : structures)
            {
                total += s.encoded_size();
            }
            return total;
        }

        bool fits_legacy_payload(const std::vector<AdStructure> &structures)
        {
            return payload_size(structures) <= LEGACY_PAYLOAD_LIMIT;
        }

        Bytes serialize(const std::vector<AdStructure> &structures)
        {
            Bytes out;
            out.reserve(payload_size(structures));
            for (const auto &s : structures)
            {
                size_t length = std::min(s.data.size(), MAX_AD_DATA_LENGTH);
                out.push_back(static_cast<uint8_t>(length + 1));
                out.push_back(s.type);
                out.insert(out.end(), s.data.begin(), s.data.begin() + static_cast<std::ptrdiff_t>(length));
            }
            return out;
        }

        std::string to_hex(const std::vector<AdStructure> &structures)
        {
            return to_hex(serialize(structures), " ");
        }

    } // namespace advertising
} // namespace blueadv
