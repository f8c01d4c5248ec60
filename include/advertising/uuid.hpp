#ifndef BLUEADV_ADVERTISING_UUID_HPP
#define BLUEADV_ADVERTISING_UUID_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace blueadv
{
    namespace advertising
    {

        /**
         * Bluetooth UUID stored as 128 bits in big-endian (textual) order.
         *
         * 16- and 32-bit aliases are expanded onto the Bluetooth Base UUID
         * 00000000-0000-1000-8000-00805F9B34FB.
         */
        class BluetoothUuid
        {
        public:
            BluetoothUuid();

            // Accepts "ABCD", "0000ABCD" or "0000abcd-0000-1000-8000-00805f9b34fb"
            static BluetoothUuid parse(const std::string &text);
            static bool is_valid(const std::string &text);
            static BluetoothUuid from_uint16(uint16_t value);
            static BluetoothUuid from_uint32(uint32_t value);

            bool is_shortenable() const;

            // 2, 4 or 16
            size_t shortest_size() const;

            std::string to_string() const;
            std::string to_short_string() const;

            // Over-the-air form; size must be 2, 4 or 16 and no smaller than shortest_size()
            std::vector<uint8_t> to_le_bytes(size_t size) const;
            std::vector<uint8_t> to_le_bytes() const { return to_le_bytes(shortest_size()); }

            const std::array<uint8_t, 16> &bytes() const { return bytes_; }

            bool operator==(const BluetoothUuid &other) const { return bytes_ == other.bytes_; }
            bool operator!=(const BluetoothUuid &other) const { return bytes_ != other.bytes_; }
            bool operator<(const BluetoothUuid &other) const { return bytes_ < other.bytes_; }

        private:
            explicit BluetoothUuid(const std::array<uint8_t, 16> &bytes) : bytes_(bytes) {}

            uint32_t leading_value() const;

            std::array<uint8_t, 16> bytes_;
        };

    } // namespace advertising
} // namespace blueadv

#endif // BLUEADV_ADVERTISING_UUID_HPP
