#ifndef BLUEADV_ADVERTISING_AD_PAYLOAD_HPP
#define BLUEADV_ADVERTISING_AD_PAYLOAD_HPP

#include "advertising/bytes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace blueadv
{
    namespace advertising
    {
        class Advertisement;

        // Assigned numbers for AD types
        namespace ad_type
        {
            constexpr uint8_t FLAGS = 0x01;
            constexpr uint8_t COMPLETE_UUID16 = 0x03;
            constexpr uint8_t COMPLETE_UUID32 = 0x05;
            constexpr uint8_t COMPLETE_UUID128 = 0x07;
            constexpr uint8_t COMPLETE_LOCAL_NAME = 0x09;
            constexpr uint8_t TX_POWER = 0x0A;
            constexpr uint8_t SOLICIT_UUID16 = 0x14;
            constexpr uint8_t SOLICIT_UUID128 = 0x15;
            constexpr uint8_t SERVICE_DATA16 = 0x16;
            constexpr uint8_t APPEARANCE = 0x19;
            constexpr uint8_t SOLICIT_UUID32 = 0x1F;
            constexpr uint8_t SERVICE_DATA32 = 0x20;
            constexpr uint8_t SERVICE_DATA128 = 0x21;
            constexpr uint8_t MANUFACTURER_DATA = 0xFF;
        }

        // LE General Discoverable | BR/EDR Not Supported
        constexpr uint8_t PERIPHERAL_FLAGS = 0x06;

        // Legacy advertising PDU data limit
        constexpr size_t LEGACY_PAYLOAD_LIMIT = 31;

        // The length byte also counts the type byte
        constexpr size_t MAX_AD_DATA_LENGTH = 254;

        struct AdStructure
        {
            uint8_t type;
            Bytes data;

            // length byte + type byte + data
            size_t encoded_size() const { return 2 + data.size(); }
        };

        /**
         * Best-effort reconstruction of the legacy advertising payload BlueZ
         * builds from an advertisement. BlueZ may place some fields (such as
         * the local name) in the scan response instead.
         */
        std::vector<AdStructure> encode_advertising_data(const Advertisement &adv);

        size_t payload_size(const std::vector<AdStructure> &structures);
        bool fits_legacy_payload(const std::vector<AdStructure> &structures);

        // Length-type-value bytes in order; data past MAX_AD_DATA_LENGTH is cut
        Bytes serialize(const std::vector<AdStructure> &structures);

        std::string to_hex(const std::vector<AdStructure> &structures);

    } // namespace advertising
} // namespace blueadv

#endif // BLUEADV_ADVERTISING_AD_PAYLOAD_HPP
