#ifndef BLUEADV_ADVERTISING_BYTES_HPP
#define BLUEADV_ADVERTISING_BYTES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace blueadv
{
    namespace advertising
    {
        using Bytes = std::vector<uint8_t>;

        // "01 02:0a-FF" style separators are tolerated; throws std::invalid_argument
        Bytes parse_hex_bytes(const std::string &text);

        std::string to_hex(const Bytes &bytes, const std::string &separator = "");

        // Decimal or 0x-prefixed hex, range checked against 0xFFFF
        uint16_t parse_company_id(const std::string &text);

    } // namespace advertising
} // namespace blueadv

#endif // BLUEADV_ADVERTISING_BYTES_HPP
