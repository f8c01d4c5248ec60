#include "advertising/uuid.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blueadv
{
    namespace advertising
    {
        namespace
        {
            // 00000000-0000-1000-8000-00805F9B34FB
            constexpr std::array<uint8_t, 16> BASE_UUID = {
                0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
                0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB};

            int hex_value(char c)
            {
                if (c >= '0' && c <= '9')
                    return c - '0';
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (c >= 'a' && c <= 'f')
                    return c - 'a' + 10;
                return -1;
            }

            bool parse_hex_digits(const std::string &digits, std::vector<uint8_t> &out)
            {
                if (digits.size() % 2 != 0)
                    return false;

                out.clear();
                for (size_t i = 0; i < digits.size(); i += 2)
                {
                    int hi = hex_value(digits[i]);
                    int lo = hex_value(digits[i + 1]);
                    if (hi < 0 || lo < 0)
                        return false;
                    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
                }
                return true;
            }
        } // namespace

        BluetoothUuid::BluetoothUuid() : bytes_(BASE_UUID)
        {
        }

        BluetoothUuid BluetoothUuid::parse(const std::string &text)
        {
            std::string digits;

            if (text.size() == 4 || text.size() == 8)
            {
                digits = text;
            }
            else if (text.size() == 36)
            {
                for (size_t i = 0; i < text.size(); ++i)
                {
                    bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
                    if (dash_position != (text[i] == '-'))
                    {
                        throw std::invalid_argument("Malformed UUID: " + text);
                    }
                    if (!dash_position)
                    {
                        digits.push_back(text[i]);
                    }
                }
            }
            else
            {
                throw std::invalid_argument("UUID must have 4, 8 or 32 hex digits: " + text);
            }

            std::vector<uint8_t> raw;
            if (!parse_hex_digits(digits, raw))
            {
                throw std::invalid_argument("UUID contains non-hex characters: " + text);
            }

            std::array<uint8_t, 16> bytes = BASE_UUID;
            if (raw.size() == 2)
            {
                bytes[2] = raw[0];
                bytes[3] = raw[1];
            }
            else
            {
                std::copy(raw.begin(), raw.end(), bytes.begin());
            }
            return BluetoothUuid(bytes);
        }

        bool BluetoothUuid::is_valid(const std::string &text)
        {
            try
            {
                parse(text);
                return true;
            }
            catch (const std::invalid_argument &)
            {
                return false;
            }
        }

        BluetoothUuid BluetoothUuid::from_uint16(uint16_t value)
        {
            return from_uint32(value);
        }

        BluetoothUuid BluetoothUuid::from_uint32(uint32_t value)
        {
            std::array<uint8_t, 16> bytes = BASE_UUID;
            bytes[0] = static_cast<uint8_t>(value >> 24);
            bytes[1] = static_cast<uint8_t>(value >> 16);
            bytes[2] = static_cast<uint8_t>(value >> 8);
            bytes[3] = static_cast<uint8_t>(value);
            return BluetoothUuid(bytes);
        }

        bool BluetoothUuid::is_shortenable() const
        {
            return std::equal(bytes_.begin() + 4, bytes_.end(), BASE_UUID.begin() + 4);
        }

        uint32_t BluetoothUuid::leading_value() const
        {
            return (static_cast<uint32_t>(bytes_[0]) << 24) |
                   (static_cast<uint32_t>(bytes_[1]) << 16) |
                   (static_cast<uint32_t>(bytes_[2]) << 8) |
                   static_cast<uint32_t>(bytes_[3]);
        }

        size_t BluetoothUuid::shortest_size() const
        {
            if (!is_shortenable())
                return 16;
            return leading_value() <= 0xFFFF ? 2 : 4;
        }

        std::string BluetoothUuid::to_string() const
        {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (size_t i = 0; i < bytes_.size(); ++i)
            {
                if (i == 4 || i == 6 || i == 8 || i == 10)
                {
                    ss << '-';
                }
                ss << std::setw(2) << static_cast<int>(bytes_[i]);
            }
            return ss.str();
        }

        std::string BluetoothUuid::to_short_string() const
        {
            size_t size = shortest_size();
            if (size == 16)
            {
                return to_string();
            }

            std::ostringstream ss;
            ss << std::hex << std::setfill('0') << std::setw(static_cast<int>(size * 2)) << leading_value();
            return ss.str();
        }

        std::vector<uint8_t> BluetoothUuid::to_le_bytes(size_t size) const
        {
            if (size != 2 && size != 4 && size != 16)
            {
                throw std::invalid_argument("UUID size must be 2, 4 or 16 bytes");
            }
            if (size < shortest_size())
            {
                throw std::invalid_argument("UUID " + to_string() + " cannot be encoded in " +
                                            std::to_string(size) + " bytes");
            }

            if (size == 16)
            {
                return std::vector<uint8_t>(bytes_.rbegin(), bytes_.rend());
            }

            uint32_t value = leading_value();
            std::vector<uint8_t> out;
            for (size_t i = 0; i < size; ++i)
            {
                out.push_back(static_cast<uint8_t>(value >> (8 * i)));
            }
            return out;
        }

    } // namespace advertising
} // namespace blueadv
