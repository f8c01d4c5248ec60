#include "advertising/bytes.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blueadv
{
    namespace advertising
    {

        Bytes parse_hex_bytes(const std::string &text)
        {
            std::string digits;
            for (char c : text)
            {
                if (c == ' ' || c == ':' || c == '-')
                    continue;
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                {
                    throw std::invalid_argument("Invalid hex character in '" + text + "'");
                }
                digits.push_back(c);
            }

            if (digits.size() % 2 != 0)
            {
                throw std::invalid_argument("Hex string has an odd number of digits: '" + text + "'");
            }

            Bytes out;
            out.reserve(digits.size() / 2);
            for (size_t i = 0; i < digits.size(); i += 2)
            {
                out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
            }
            return out;
        }

        std::string to_hex(const Bytes &bytes, const std::string &separator)
        {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (size_t i = 0; i < bytes.size(); ++i)
            {
                if (i > 0)
                    ss << separator;
                ss << std::setw(2) << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

        uint16_t parse_company_id(const std::string &text)
        {
            if (text.empty())
            {
                throw std::invalid_argument("Company identifier is empty");
            }

            bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
            std::string digits = hex ? text.substr(2) : text;
            if (!std::isxdigit(static_cast<unsigned char>(digits.front())))
            {
                throw std::invalid_argument("Company identifier is not a number: '" + text + "'");
            }

            unsigned long value = 0;
            size_t consumed = 0;
            try
            {
                value = std::stoul(digits, &consumed, hex ? 16 : 10);
            }
            catch (const std::logic_error &)
            {
                throw std::invalid_argument("Company identifier is not a number: '" + text + "'");
            }

            if (consumed != digits.size())
            {
                throw std::invalid_argument("Company identifier is not a number: '" + text + "'");
            }
            if (value > 0xFFFF)
            {
                throw std::invalid_argument("Company identifier exceeds 0xFFFF: '" + text + "'");
            }
            return static_cast<uint16_t>(value);
        }

    } // namespace advertising
} // namespace blueadv
