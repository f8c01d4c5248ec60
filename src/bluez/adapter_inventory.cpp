#include "bluez/adapter_inventory.hpp"
#include "core/logger.hpp"

#include <simpleble/Adapter.h>

#include <exception>

namespace blueadv
{
    namespace bluez
    {

        bool bluetooth_enabled()
        {
            auto logger = core::get_logger("AdapterInventory");
            try
            {
                return SimpleBLE::Adapter::bluetooth_enabled();
            }
            catch (const std::exception &e)
            {
                logger->error("Bluetooth state query failed", core::LogContext{}.add("error", e.what()));
                return false;
            }
        }

        std::vector<AdapterInfo> list_adapters()
        {
            auto logger = core::get_logger("AdapterInventory");
            std::vector<AdapterInfo> result;

            try
            {
                auto adapters = SimpleBLE::Adapter::get_adapters();
                if (adapters.empty())
                {
                    logger->warning("No BLE adapters found");
                    return result;
                }

                for (auto &adapter : adapters)
                {
                    if (!adapter.initialized())
                    {
                        logger->warning("Skipping uninitialized adapter");
                        continue;
                    }

                    AdapterInfo info{adapter.identifier(), adapter.address()};
                    logger->debug("Found adapter", core::LogContext{}.add("identifier", info.identifier).add("address", info.address));
                    result.push_back(info);
                }
            }
            catch (const std::exception &e)
            {
                logger->error("Adapter enumeration failed", core::LogContext{}.add("error", e.what()));
            }

            return result;
        }

    } // namespace bluez
} // namespace blueadv
