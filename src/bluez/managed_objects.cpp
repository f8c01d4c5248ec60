#include "bluez/managed_objects.hpp"
#include "bluez/constants.hpp"

namespace blueadv
{
    namespace bluez
    {

        std::string adapter_path_for(const std::string &name)
        {
            if (name.empty() || name.front() == '/')
            {
                return name;
            }
            return std::string(ADAPTER_PATH_PREFIX) + name;
        }

        bool has_interface(const nlohmann::json &objects, const std::string &path, const std::string &interface)
        {
            if (!objects.is_object())
                return false;

            auto it = objects.find(path);
            if (it == objects.end() || !it->is_object())
                return false;

            return it->contains(interface);
        }

        AdapterSelection select_advertising_adapter(const nlohmann::json &objects, const std::string &preferred)
        {
            AdapterSelection selection;

            if (!preferred.empty())
            {
                selection.path = adapter_path_for(preferred);
                selection.found = has_interface(objects, selection.path, LE_ADVERTISING_MANAGER_INTERFACE);
                return selection;
            }

            selection.path = DEFAULT_ADAPTER_PATH;
            if (!objects.is_object())
            {
                return selection;
            }

            for (const auto &[path, interfaces] : objects.items())
            {
                if (interfaces.is_object() && interfaces.contains(LE_ADVERTISING_MANAGER_INTERFACE))
                {
                    selection.path = path;
                    selection.found = true;
                }
            }
            return selection;
        }

        std::vector<std::string> adapter_paths(const nlohmann::json &objects)
        {
            std::vector<std::string> paths;
            if (!objects.is_object())
            {
                return paths;
            }

            for (const auto &[path, interfaces] : objects.items())
            {
                if (interfaces.is_object() && interfaces.contains(ADAPTER_INTERFACE))
                {
                    paths.push_back(path);
                }
            }
            return paths;
        }

    } // namespace bluez
} // namespace blueadv
