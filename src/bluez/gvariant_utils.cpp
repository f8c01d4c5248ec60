#include "bluez/gvariant_utils.hpp"
#include "advertising/advertisement.hpp"
#include "advertising/uuid.hpp"

#include <stdexcept>

namespace blueadv
{
    namespace bluez
    {
        namespace
        {
            std::string key_to_string(GVariant *key)
            {
                nlohmann::json value = variant_to_json(key);
                if (value.is_string())
                {
                    return value.get<std::string>();
                }
                return value.dump();
            }

            std::vector<std::string> strings_from(GVariant *value)
            {
                std::vector<std::string> out;
                gsize length = 0;
                const gchar **items = g_variant_get_strv(value, &length);
                for (gsize i = 0; i < length; ++i)
                {
                    out.emplace_back(items[i]);
                }
                g_free(items);
                return out;
            }

            // BlueZ receives the shortest lowercase form
            std::vector<std::string> short_uuids(const std::vector<std::string> &uuids)
            {
                std::vector<std::string> out;
                out.reserve(uuids.size());
                for (const auto &uuid : uuids)
                {
                    out.push_back(advertising::BluetoothUuid::parse(uuid).to_short_string());
                }
                return out;
            }

            advertising::Bytes bytes_from(GVariant *value)
            {
                gsize length = 0;
                const guint8 *data = static_cast<const guint8 *>(
                    g_variant_get_fixed_array(value, &length, sizeof(guint8)));
                return advertising::Bytes(data, data + length);
            }

            // Accepts "ay" directly or boxed in a "v"
            bool unbox_bytes(GVariant *value, advertising::Bytes &out)
            {
                VariantPtr inner;
                if (g_variant_is_of_type(value, G_VARIANT_TYPE_VARIANT))
                {
                    inner.reset(g_variant_get_variant(value));
                    value = inner.get();
                }
                if (!g_variant_is_of_type(value, G_VARIANT_TYPE_BYTESTRING))
                {
                    return false;
                }
                out = bytes_from(value);
                return true;
            }
        } // namespace

        nlohmann::json variant_to_json(GVariant *value)
        {
            if (!value)
            {
                return nullptr;
            }

            if (g_variant_is_of_type(value, G_VARIANT_TYPE_VARIANT))
            {
                VariantPtr inner(g_variant_get_variant(value));
                return variant_to_json(inner.get());
            }

            switch (g_variant_classify(value))
            {
            case G_VARIANT_CLASS_BOOLEAN:
                return static_cast<bool>(g_variant_get_boolean(value));
            case G_VARIANT_CLASS_BYTE:
                return g_variant_get_byte(value);
            case G_VARIANT_CLASS_INT16:
                return g_variant_get_int16(value);
            case G_VARIANT_CLASS_UINT16:
                return g_variant_get_uint16(value);
            case G_VARIANT_CLASS_INT32:
                return g_variant_get_int32(value);
            case G_VARIANT_CLASS_UINT32:
                return g_variant_get_uint32(value);
            case G_VARIANT_CLASS_INT64:
                return g_variant_get_int64(value);
            case G_VARIANT_CLASS_UINT64:
                return g_variant_get_uint64(value);
            case G_VARIANT_CLASS_HANDLE:
                return g_variant_get_handle(value);
            case G_VARIANT_CLASS_DOUBLE:
                return g_variant_get_double(value);
            case G_VARIANT_CLASS_STRING:
            case G_VARIANT_CLASS_OBJECT_PATH:
            case G_VARIANT_CLASS_SIGNATURE:
                return std::string(g_variant_get_string(value, nullptr));
            case G_VARIANT_CLASS_MAYBE:
            {
                VariantPtr inner(g_variant_get_maybe(value));
                return variant_to_json(inner.get());
            }
            default:
                break;
            }

            const GVariantType *type = g_variant_get_type(value);
            gsize count = g_variant_n_children(value);

            bool is_dictionary = g_variant_type_is_array(type) &&
                                 g_variant_type_is_dict_entry(g_variant_type_element(type));
            if (is_dictionary)
            {
                nlohmann::json object = nlohmann::json::object();
                for (gsize i = 0; i < count; ++i)
                {
                    VariantPtr entry(g_variant_get_child_value(value, i));
                    VariantPtr key(g_variant_get_child_value(entry.get(), 0));
                    VariantPtr item(g_variant_get_child_value(entry.get(), 1));
                    object[key_to_string(key.get())] = variant_to_json(item.get());
                }
                return object;
            }

            // Arrays, tuples and lone dict entries
            nlohmann::json array = nlohmann::json::array();
            for (gsize i = 0; i < count; ++i)
            {
                VariantPtr child(g_variant_get_child_value(value, i));
                array.push_back(variant_to_json(child.get()));
            }
            return array;
        }

        nlohmann::json unpack_managed_objects(GVariant *reply)
        {
            if (!reply || !g_variant_is_of_type(reply, G_VARIANT_TYPE("(a{oa{sa{sv}}})")))
            {
                return nlohmann::json::object();
            }

            VariantPtr objects(g_variant_get_child_value(reply, 0));
            return variant_to_json(objects.get());
        }

        GVariant *make_string_array(const std::vector<std::string> &values)
        {
            GVariantBuilder builder;
            g_variant_builder_init(&builder, G_VARIANT_TYPE_STRING_ARRAY);
            for (const auto &value : values)
            {
                g_variant_builder_add(&builder, "s", value.c_str());
            }
            return g_variant_builder_end(&builder);
        }

        GVariant *make_byte_array(const advertising::Bytes &bytes)
        {
            GVariantBuilder builder;
            g_variant_builder_init(&builder, G_VARIANT_TYPE_BYTESTRING);
            for (uint8_t b : bytes)
            {
                g_variant_builder_add(&builder, "y", b);
            }
            return g_variant_builder_end(&builder);
        }

        GVariant *make_manufacturer_data(const std::map<uint16_t, advertising::Bytes> &data)
        {
            GVariantBuilder builder;
            g_variant_builder_init(&builder, G_VARIANT_TYPE("a{qv}"));
            for (const auto &[company, payload] : data)
            {
                g_variant_builder_add(&builder, "{qv}", static_cast<guint16>(company), make_byte_array(payload));
            }
            return g_variant_builder_end(&builder);
        }

        GVariant *make_service_data(const std::map<std::string, advertising::Bytes> &data)
        {
            GVariantBuilder builder;
            g_variant_builder_init(&builder, G_VARIANT_TYPE("a{sv}"));
            for (const auto &[uuid, payload] : data)
            {
                g_variant_builder_add(&builder, "{sv}", uuid.c_str(), make_byte_array(payload));
            }
            return g_variant_builder_end(&builder);
        }

        GVariant *advertisement_property(const advertising::Advertisement &adv, const std::string &name)
        {
            namespace property = advertising::property;

            if (!adv.exposes(name))
            {
                return nullptr;
            }

            if (name == property::TYPE)
                return g_variant_new_string(advertising::type_to_string(adv.type()).c_str());
            if (name == property::SERVICE_UUIDS)
                return make_string_array(short_uuids(adv.service_uuids()));
            if (name == property::SOLICIT_UUIDS)
                return make_string_array(short_uuids(adv.solicit_uuids()));
            if (name == property::MANUFACTURER_DATA)
                return make_manufacturer_data(adv.manufacturer_data());
            if (name == property::SERVICE_DATA)
            {
                std::map<std::string, advertising::Bytes> data;
                for (const auto &[uuid, payload] : adv.service_data())
                {
                    data[advertising::BluetoothUuid::parse(uuid).to_short_string()] = payload;
                }
                return make_service_data(data);
            }
            if (name == property::LOCAL_NAME)
                return g_variant_new_string(adv.local_name().c_str());
            if (name == property::APPEARANCE)
                return g_variant_new_uint16(*adv.appearance());
            if (name == property::INCLUDES)
                return make_string_array(adv.includes());
            if (name == property::TIMEOUT)
                return g_variant_new_uint16(adv.timeout());
            if (name == property::DURATION)
                return g_variant_new_uint16(adv.duration());

            return nullptr;
        }

        bool apply_advertisement_property(advertising::Advertisement &adv, const std::string &name,
                                          GVariant *value, std::string &error)
        {
            namespace property = advertising::property;

            auto expect = [&](const GVariantType *type) {
                if (g_variant_is_of_type(value, type))
                    return true;
                error = "Property " + name + " expects signature " +
                        std::string(g_variant_type_peek_string(type), g_variant_type_get_string_length(type));
                return false;
            };

            try
            {
                if (name == property::TYPE)
                {
                    if (!expect(G_VARIANT_TYPE_STRING))
                        return false;
                    adv.set_type(g_variant_get_string(value, nullptr));
                }
                else if (name == property::SERVICE_UUIDS || name == property::SOLICIT_UUIDS ||
                         name == property::INCLUDES)
                {
                    if (!expect(G_VARIANT_TYPE_STRING_ARRAY))
                        return false;
                    auto values = strings_from(value);
                    if (name == property::SERVICE_UUIDS)
                    {
                        // Appends; a bad entry leaves the list unchanged
                        for (const auto &uuid : values)
                            advertising::BluetoothUuid::parse(uuid);
                        for (const auto &uuid : values)
                            adv.add_service_uuid(uuid);
                    }
                    else if (name == property::SOLICIT_UUIDS)
                        adv.set_solicit_uuids(values);
                    else
                        adv.set_includes(values);
                }
                else if (name == property::MANUFACTURER_DATA)
                {
                    if (!expect(G_VARIANT_TYPE("a{qv}")))
                        return false;

                    std::map<uint16_t, advertising::Bytes> data;
                    gsize count = g_variant_n_children(value);
                    for (gsize i = 0; i < count; ++i)
                    {
                        guint16 company = 0;
                        GVariant *payload = nullptr;
                        g_variant_get_child(value, i, "{qv}", &company, &payload);
                        VariantPtr owned(payload);

                        advertising::Bytes bytes;
                        if (!unbox_bytes(owned.get(), bytes))
                        {
                            error = "ManufacturerData values must be byte arrays";
                            return false;
                        }
                        data[company] = bytes;
                    }
                    adv.set_manufacturer_data(data);
                }
                else if (name == property::SERVICE_DATA)
                {
                    if (!expect(G_VARIANT_TYPE("a{sv}")))
                        return false;

                    std::map<std::string, advertising::Bytes> data;
                    gsize count = g_variant_n_children(value);
                    for (gsize i = 0; i < count; ++i)
                    {
                        const gchar *uuid = nullptr;
                        GVariant *payload = nullptr;
                        g_variant_get_child(value, i, "{&sv}", &uuid, &payload);
                        VariantPtr owned(payload);

                        advertising::Bytes bytes;
                        if (!unbox_bytes(owned.get(), bytes))
                        {
                            error = "ServiceData values must be byte arrays";
                            return false;
                        }
                        data[uuid] = bytes;
                    }
                    adv.set_service_data(data);
                }
                else if (name == property::LOCAL_NAME)
                {
                    if (!expect(G_VARIANT_TYPE_STRING))
                        return false;
                    adv.set_local_name(g_variant_get_string(value, nullptr));
                }
                else if (name == property::APPEARANCE || name == property::TIMEOUT || name == property::DURATION)
                {
                    if (!expect(G_VARIANT_TYPE_UINT16))
                        return false;
                    guint16 number = g_variant_get_uint16(value);
                    if (name == property::APPEARANCE)
                        adv.set_appearance(number);
                    else if (name == property::TIMEOUT)
                        adv.set_timeout(number);
                    else
                        adv.set_duration(number);
                }
                else
                {
                    error = "Unknown property " + name;
                    return false;
                }
            }
            catch (const std::invalid_argument &e)
            {
                error = e.what();
                return false;
            }

            return true;
        }

    } // namespace bluez
} // namespace blueadv
