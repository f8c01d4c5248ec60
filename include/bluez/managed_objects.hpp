#ifndef BLUEADV_BLUEZ_MANAGED_OBJECTS_HPP
#define BLUEADV_BLUEZ_MANAGED_OBJECTS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace blueadv
{
    namespace bluez
    {

        struct AdapterSelection
        {
            std::string path;
            bool found = false;
        };

        // "hci1" -> "/org/bluez/hci1"; full paths are returned unchanged
        std::string adapter_path_for(const std::string &name);

        /**
         * Picks the adapter to advertise on from an unpacked GetManagedObjects
         * reply ({path: {interface: {property: value}}}).
         *
         * With a preferred adapter, only that one is accepted. Otherwise the
         * last path exposing LEAdvertisingManager1 wins; when there is none the
         * selection falls back to /org/bluez/hci0 with found=false.
         */
        AdapterSelection select_advertising_adapter(const nlohmann::json &objects,
                                                    const std::string &preferred = "");

        std::vector<std::string> adapter_paths(const nlohmann::json &objects);

        bool has_interface(const nlohmann::json &objects, const std::string &path, const std::string &interface);

    } // namespace bluez
} // namespace blueadv

#endif // BLUEADV_BLUEZ_MANAGED_OBJECTS_HPP
