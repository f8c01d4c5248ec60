#ifndef BLUEADV_BLUEZ_ADAPTER_INVENTORY_HPP
#define BLUEADV_BLUEZ_ADAPTER_INVENTORY_HPP

#include <string>
#include <vector>

namespace blueadv
{
    namespace bluez
    {

        struct AdapterInfo
        {
            std::string identifier; // e.g. "hci0"
            std::string address;
        };

        /**
         * Local adapter preflight. Library failures are logged and reported
         * as "disabled" / an empty list.
         */
        bool bluetooth_enabled();
        std::vector<AdapterInfo> list_adapters();

    } // namespace bluez
} // namespace blueadv

#endif // BLUEADV_BLUEZ_ADAPTER_INVENTORY_HPP
