#ifndef BLUEADV_BLUEZ_ADVERTISING_BACKEND_HPP
#define BLUEADV_BLUEZ_ADVERTISING_BACKEND_HPP

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace blueadv
{
    namespace core
    {
        class AdvertiserConfig;
    }

    namespace advertising
    {
        class Advertisement;
    }

    namespace bluez
    {

        /**
         * Outcome of a D-Bus call. error_name carries the remote error
         * (e.g. org.bluez.Error.AlreadyExists) when the peer replied with one.
         */
        struct CallResult
        {
            bool ok = true;
            std::string error_name;
            std::string error_message;

            static CallResult success() { return CallResult{}; }
            static CallResult failure(const std::string &name, const std::string &message)
            {
                return CallResult{false, name, message};
            }
        };

        class IAdvertisingBackend
        {
        public:
            virtual ~IAdvertisingBackend() = default;

            virtual CallResult connect() = 0;
            virtual bool is_connected() const = 0;

            // The object must outlive the export
            virtual CallResult export_advertisement(advertising::Advertisement &adv) = 0;
            virtual void unexport_advertisement() = 0;

            virtual CallResult request_name(const std::string &bus_name) = 0;
            virtual CallResult get_managed_objects(nlohmann::json &objects) = 0;
            virtual CallResult set_adapter_powered(const std::string &adapter_path, bool powered) = 0;

            virtual CallResult register_advertisement(const std::string &adapter_path, const std::string &object_path) = 0;
            virtual CallResult unregister_advertisement(const std::string &adapter_path, const std::string &object_path) = 0;

            // Blocks until quit() or the bus connection closes
            virtual void run() = 0;
            virtual void quit() = 0;
        };

        std::unique_ptr<IAdvertisingBackend> create_gio_backend(const core::AdvertiserConfig &config);

    } // namespace bluez
} // namespace blueadv

#endif // BLUEADV_BLUEZ_ADVERTISING_BACKEND_HPP
