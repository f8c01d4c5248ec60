#ifndef BLUEADV_BLUEZ_CONSTANTS_HPP
#define BLUEADV_BLUEZ_CONSTANTS_HPP

namespace blueadv
{
    namespace bluez
    {
        // freedesktop interfaces
        constexpr const char *DBUS_SERVICE = "org.freedesktop.DBus";
        constexpr const char *DBUS_PATH = "/org/freedesktop/DBus";
        constexpr const char *DBUS_INTERFACE = "org.freedesktop.DBus";
        constexpr const char *OBJECT_MANAGER_INTERFACE = "org.freedesktop.DBus.ObjectManager";
        constexpr const char *PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";

        // BlueZ
        constexpr const char *BLUEZ_SERVICE = "org.bluez";
        constexpr const char *ADAPTER_INTERFACE = "org.bluez.Adapter1";
        constexpr const char *LE_ADVERTISING_MANAGER_INTERFACE = "org.bluez.LEAdvertisingManager1";
        constexpr const char *LE_ADVERTISEMENT_INTERFACE = "org.bluez.LEAdvertisement1";

        constexpr const char *DEFAULT_ADAPTER_PATH = "/org/bluez/hci0";
        constexpr const char *ADAPTER_PATH_PREFIX = "/org/bluez/";

        // Error returned by UnregisterAdvertisement when nothing was registered
        constexpr const char *ERROR_DOES_NOT_EXIST = "org.bluez.Error.DoesNotExist";

    } // namespace bluez
} // namespace blueadv

#endif // BLUEADV_BLUEZ_CONSTANTS_HPP
