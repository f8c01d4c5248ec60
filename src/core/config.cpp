#include "core/config.hpp"
#include "core/logger.hpp"
#include "advertising/bytes.hpp"
#include "advertising/uuid.hpp"

#include <cstdio>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace blueadv
{
    namespace core
    {
        namespace
        {
            // Rejects floats, booleans and values outside [min, max] before narrowing
            int integer_from_json(const nlohmann::json &value, const std::string &key,
                                  int64_t min = std::numeric_limits<int>::min(),
                                  int64_t max = std::numeric_limits<int>::max())
            {
                if (!value.is_number_integer())
                {
                    throw std::invalid_argument(key + " must be an integer, got " + value.dump());
                }

                bool in_range = value.is_number_unsigned()
                                    ? value.get<uint64_t>() <= static_cast<uint64_t>(max)
                                    : value.get<int64_t>() >= min && value.get<int64_t>() <= max;
                if (!in_range)
                {
                    throw std::invalid_argument(key + " is out of range: " + value.dump());
                }
                return static_cast<int>(value.get<int64_t>());
            }

            void require_uuids(const std::vector<std::string> &uuids, const std::string &key)
            {
                for (const auto &uuid : uuids)
                {
                    if (!advertising::BluetoothUuid::is_valid(uuid))
                    {
                        throw std::invalid_argument(key + " contains an invalid UUID: " + uuid);
                    }
                }
            }

            std::vector<uint8_t> bytes_from_json(const nlohmann::json &value)
            {
                if (value.is_string())
                {
                    return advertising::parse_hex_bytes(value.get<std::string>());
                }

                if (value.is_array())
                {
                    std::vector<uint8_t> out;
                    for (const auto &item : value)
                    {
                        out.push_back(static_cast<uint8_t>(integer_from_json(item, "Byte value", 0, 0xFF)));
                    }
                    return out;
                }

                throw std::invalid_argument("Expected a hex string or an array of bytes, got " + value.dump());
            }
        } // namespace

        // AdvertisementConfig implementation
        void AdvertisementConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("type"))
            {
                type = j["type"].get<std::string>();
                if (type != "broadcast" && type != "peripheral")
                {
                    throw std::invalid_argument("Unknown advertisement type: " + type);
                }
            }
            if (j.contains("local_name"))
                local_name = j["local_name"].get<std::string>();
            if (j.contains("service_uuids"))
            {
                service_uuids = j["service_uuids"].get<std::vector<std::string>>();
                require_uuids(service_uuids, "service_uuids");
            }
            if (j.contains("solicit_uuids"))
            {
                solicit_uuids = j["solicit_uuids"].get<std::vector<std::string>>();
                require_uuids(solicit_uuids, "solicit_uuids");
            }
            if (j.contains("includes"))
                includes = j["includes"].get<std::vector<std::string>>();
            if (j.contains("timeout"))
                timeout = integer_from_json(j["timeout"], "timeout");
            if (j.contains("duration"))
                duration = integer_from_json(j["duration"], "duration");
            if (j.contains("object_path"))
                object_path = j["object_path"].get<std::string>();

            if (j.contains("manufacturer_data"))
            {
                manufacturer_data.clear();
                for (const auto &[key, value] : j["manufacturer_data"].items())
                {
                    manufacturer_data[advertising::parse_company_id(key)] = bytes_from_json(value);
                }
            }

            if (j.contains("service_data"))
            {
                service_data.clear();
                for (const auto &[key, value] : j["service_data"].items())
                {
                    if (!advertising::BluetoothUuid::is_valid(key))
                    {
                        throw std::invalid_argument("service_data has an invalid UUID key: " + key);
                    }
                    service_data[key] = bytes_from_json(value);
                }
            }

            if (j.contains("appearance"))
            {
                if (j["appearance"].is_null())
                {
                    appearance.reset();
                }
                else
                {
                    appearance = static_cast<uint16_t>(integer_from_json(j["appearance"], "appearance", 0, 0xFFFF));
                }
            }
        }

        nlohmann::json AdvertisementConfig::to_json() const
        {
            nlohmann::json manufacturer = nlohmann::json::object();
            for (const auto &[company, payload] : manufacturer_data)
            {
                char key[8];
                std::snprintf(key, sizeof(key), "0x%04X", static_cast<unsigned>(company));
                manufacturer[key] = advertising::to_hex(payload);
            }

            nlohmann::json services = nlohmann::json::object();
            for (const auto &[uuid, payload] : service_data)
            {
                services[uuid] = advertising::to_hex(payload);
            }

            nlohmann::json j{
                {"type", type},
                {"local_name", local_name},
                {"service_uuids", service_uuids},
                {"solicit_uuids", solicit_uuids},
                {"manufacturer_data", manufacturer},
                {"service_data", services},
                {"includes", includes},
                {"timeout", timeout},
                {"duration", duration},
                {"object_path", object_path}};

            if (appearance)
                j["appearance"] = *appearance;
            else
                j["appearance"] = nullptr;
            return j;
        }

        // AdapterConfig implementation
        void AdapterConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("name"))
                name = j["name"].get<std::string>();
            if (j.contains("power_on"))
                power_on = j["power_on"];
            if (j.contains("bus_name"))
                bus_name = j["bus_name"].get<std::string>();
        }

        nlohmann::json AdapterConfig::to_json() const
        {
            return nlohmann::json{
                {"name", name},
                {"power_on", power_on},
                {"bus_name", bus_name}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"].get<std::string>();
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"].get<std::string>();
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // SessionConfig implementation
        void SessionConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("exit_on_release"))
                exit_on_release = j["exit_on_release"];
            if (j.contains("call_timeout_ms"))
                call_timeout_ms = integer_from_json(j["call_timeout_ms"], "call_timeout_ms");
            if (j.contains("bus_address") && !j["bus_address"].is_null())
                bus_address = j["bus_address"].get<std::string>();
        }

        nlohmann::json SessionConfig::to_json() const
        {
            nlohmann::json j{
                {"exit_on_release", exit_on_release},
                {"call_timeout_ms", call_timeout_ms}};
            if (!bus_address.empty())
            {
                j["bus_address"] = bus_address;
            }
            return j;
        }

        // AdvertiserConfig implementation
        std::unique_ptr<AdvertiserConfig> AdvertiserConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<AdvertiserConfig> AdvertiserConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Configuration root must be a JSON object");
            }

            auto config = std::make_unique<AdvertiserConfig>();

            try
            {
                if (j.contains("advertisement"))
                    config->advertisement.from_json(j["advertisement"]);
                if (j.contains("adapter"))
                    config->adapter.from_json(j["adapter"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
                if (j.contains("session"))
                    config->session.from_json(j["session"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Configuration value has the wrong type: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<AdvertiserConfig> AdvertiserConfig::create_default()
        {
            return std::make_unique<AdvertiserConfig>();
        }

        nlohmann::json AdvertiserConfig::to_json() const
        {
            return nlohmann::json{
                {"advertisement", advertisement.to_json()},
                {"adapter", adapter.to_json()},
                {"logging", logging.to_json()},
                {"session", session.to_json()}};
        }

        void AdvertiserConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::vector<std::string> AdvertiserConfig::validation_errors() const
        {
            std::vector<std::string> errors;

            if (advertisement.type != "broadcast" && advertisement.type != "peripheral")
            {
                errors.push_back("advertisement.type must be 'broadcast' or 'peripheral'");
            }

            for (const auto &uuid : advertisement.service_uuids)
            {
                if (!advertising::BluetoothUuid::is_valid(uuid))
                    errors.push_back("advertisement.service_uuids contains an invalid UUID: " + uuid);
            }
            for (const auto &uuid : advertisement.solicit_uuids)
            {
                if (!advertising::BluetoothUuid::is_valid(uuid))
                    errors.push_back("advertisement.solicit_uuids contains an invalid UUID: " + uuid);
            }
            for (const auto &[uuid, payload] : advertisement.service_data)
            {
                if (!advertising::BluetoothUuid::is_valid(uuid))
                    errors.push_back("advertisement.service_data has an invalid UUID key: " + uuid);
            }

            static const std::set<std::string> known_includes{"tx-power", "appearance", "local-name"};
            for (const auto &include : advertisement.includes)
            {
                if (known_includes.count(include) == 0)
                    errors.push_back("advertisement.includes has an unknown entry: " + include);
            }

            if (advertisement.timeout < 0 || advertisement.timeout > 0xFFFF)
            {
                errors.push_back("advertisement.timeout must be between 0 and 65535");
            }
            if (advertisement.duration < 0 || advertisement.duration > 0xFFFF)
            {
                errors.push_back("advertisement.duration must be between 0 and 65535");
            }

            const std::string &path = advertisement.object_path;
            if (path.size() < 2 || path.front() != '/' || path.back() == '/' ||
                path.find("//") != std::string::npos ||
                path.find_first_not_of("/ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_") != std::string::npos)
            {
                errors.push_back("advertisement.object_path is not a valid D-Bus object path: " + path);
            }

            if (session.call_timeout_ms <= 0)
            {
                errors.push_back("session.call_timeout_ms must be positive");
            }

            return errors;
        }

        bool AdvertiserConfig::validate() const
        {
            auto errors = validation_errors();
            if (errors.empty())
            {
                return true;
            }

            auto logger = get_logger("Config");
            for (const auto &message : errors)
            {
                logger->error("Configuration validation error", LogContext{}.add("reason", message));
            }
            return false;
        }

    } // namespace core
} // namespace blueadv
