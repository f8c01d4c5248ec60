#ifndef BLUEADV_BLUEZ_GVARIANT_UTILS_HPP
#define BLUEADV_BLUEZ_GVARIANT_UTILS_HPP

#include "advertising/bytes.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <glib.h>
#include <nlohmann/json.hpp>

namespace blueadv
{
    namespace advertising
    {
        class Advertisement;
    }

    namespace bluez
    {
        struct VariantUnref
        {
            void operator()(GVariant *v) const
            {
                if (v)
                    g_variant_unref(v);
            }
        };

        struct ErrorFree
        {
            void operator()(GError *e) const
            {
                if (e)
                    g_error_free(e);
            }
        };

        using VariantPtr = std::unique_ptr<GVariant, VariantUnref>;
        using ErrorPtr = std::unique_ptr<GError, ErrorFree>;

        // Takes ownership, sinking floating references
        inline VariantPtr take_variant(GVariant *v)
        {
            return VariantPtr(v ? g_variant_ref_sink(v) : nullptr);
        }

        /**
         * Recursively converts a GVariant to JSON, unboxing every "v" on the way.
         * Dictionary keys become strings (numeric keys are printed in decimal).
         */
        nlohmann::json variant_to_json(GVariant *value);

        // Unpacks an "(a{oa{sa{sv}}})" GetManagedObjects reply
        nlohmann::json unpack_managed_objects(GVariant *reply);

        // Builders return new floating references
        GVariant *make_string_array(const std::vector<std::string> &values);
        GVariant *make_byte_array(const advertising::Bytes &bytes);
        GVariant *make_manufacturer_data(const std::map<uint16_t, advertising::Bytes> &data);
        GVariant *make_service_data(const std::map<std::string, advertising::Bytes> &data);

        // nullptr for unknown properties and optional ones that are not set
        GVariant *advertisement_property(const advertising::Advertisement &adv, const std::string &name);

        // Applies a Properties.Set write; false with a reason when the value is rejected
        bool apply_advertisement_property(advertising::Advertisement &adv, const std::string &name,
                                          GVariant *value, std::string &error);

    } // namespace bluez
} // namespace blueadv

#endif // BLUEADV_BLUEZ_GVARIANT_UTILS_HPP
