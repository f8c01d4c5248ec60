#include "bluez/advertising_backend.hpp"
#include "bluez/constants.hpp"
#include "bluez/gvariant_utils.hpp"
#include "advertising/advertisement.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <gio/gio.h>
#include <glib.h>

namespace blueadv
{
    namespace bluez
    {
        namespace
        {
            const char *ADVERTISEMENT_XML = R"XML(
<node>
  <interface name="org.bluez.LEAdvertisement1">
    <method name="Release">
      <annotation name="org.freedesktop.DBus.Method.NoReply" value="true"/>
    </method>
    <property name="Type"             type="s"     access="readwrite"/>
    <property name="ServiceUUIDs"     type="as"    access="readwrite"/>
    <property name="SolicitUUIDs"     type="as"    access="readwrite"/>
    <property name="ManufacturerData" type="a{qv}" access="readwrite"/>
    <property name="ServiceData"      type="a{sv}" access="readwrite"/>
    <property name="LocalName"        type="s"     access="readwrite"/>
    <property name="Appearance"       type="q"     access="readwrite"/>
    <property name="Includes"         type="as"    access="readwrite"/>
    <property name="Timeout"          type="q"     access="readwrite"/>
    <property name="Duration"         type="q"     access="readwrite"/>
  </interface>
</node>
)XML";

            CallResult result_from_error(GError *error)
            {
                if (!error)
                {
                    return CallResult::failure("org.freedesktop.DBus.Error.Failed", "Unknown error");
                }

                std::string name;
                if (g_dbus_error_is_remote_error(error))
                {
                    gchar *remote = g_dbus_error_get_remote_error(error);
                    name = remote ? remote : "";
                    g_free(remote);
                    g_dbus_error_strip_remote_error(error);
                }
                else
                {
                    name = g_quark_to_string(error->domain);
                }

                return CallResult::failure(name, error->message ? error->message : "");
            }

            struct PendingCall
            {
                bool done = false;
                GVariant *reply = nullptr;
                GError *error = nullptr;
            };

            void on_call_finished(GObject *source, GAsyncResult *res, gpointer user_data)
            {
                auto *pending = static_cast<PendingCall *>(user_data);
                pending->reply = g_dbus_connection_call_finish(G_DBUS_CONNECTION(source), res, &pending->error);
                pending->done = true;
            }
        } // namespace

        /**
         * GDBus implementation of the advertising backend.
         *
         * Outgoing calls are issued asynchronously and the default main
         * context is iterated until they finish, because BlueZ reads the
         * advertisement's properties before it replies to
         * RegisterAdvertisement and those reads are dispatched on that context.
         */
        class GioAdvertisingBackend : public IAdvertisingBackend
        {
        public:
            explicit GioAdvertisingBackend(const core::AdvertiserConfig &config)
                : call_timeout_ms_(config.session.call_timeout_ms),
                  bus_address_(config.session.bus_address),
                  logger_(core::get_logger("GioBackend"))
            {
            }

            ~GioAdvertisingBackend() override
            {
                unexport_advertisement();

                if (node_info_)
                {
                    g_dbus_node_info_unref(node_info_);
                }
                if (loop_)
                {
                    g_main_loop_unref(loop_);
                }
                if (connection_)
                {
                    if (closed_handler_)
                    {
                        g_signal_handler_disconnect(connection_, closed_handler_);
                    }
                    // Shared system bus connections stay open for other users
                    if (private_connection_)
                    {
                        g_dbus_connection_close_sync(connection_, nullptr, nullptr);
                    }
                    g_object_unref(connection_);
                }
            }

            CallResult connect() override
            {
                if (connection_)
                {
                    return CallResult::success();
                }

                GError *raw_error = nullptr;
                if (bus_address_.empty())
                {
                    connection_ = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &raw_error);
                }
                else
                {
                    connection_ = g_dbus_connection_new_for_address_sync(
                        bus_address_.c_str(),
                        static_cast<GDBusConnectionFlags>(G_DBUS_CONNECTION_FLAGS_AUTHENTICATION_CLIENT |
                                                          G_DBUS_CONNECTION_FLAGS_MESSAGE_BUS_CONNECTION),
                        nullptr, nullptr, &raw_error);
                    private_connection_ = connection_ != nullptr;
                }
                ErrorPtr error(raw_error);
                if (!connection_)
                {
                    auto result = result_from_error(error.get());
                    logger_->error("Failed to connect to the bus",
                                   core::LogContext{}.add("address", bus_address_.empty() ? "system" : bus_address_)
                                                     .add("error", result.error_message));
                    return result;
                }

                g_dbus_connection_set_exit_on_close(connection_, FALSE);
                closed_handler_ = g_signal_connect(connection_, "closed", G_CALLBACK(&GioAdvertisingBackend::on_closed), this);

                logger_->info(private_connection_ ? "Connected to bus" : "Connected to system bus",
                              core::LogContext{}.add("unique_name", g_dbus_connection_get_unique_name(connection_)));
                return CallResult::success();
            }

            bool is_connected() const override
            {
                return connection_ && !g_dbus_connection_is_closed(connection_);
            }

            CallResult export_advertisement(advertising::Advertisement &adv) override
            {
                if (!is_connected())
                {
                    return CallResult::failure("org.freedesktop.DBus.Error.Disconnected", "Not connected to the bus");
                }
                if (registration_id_)
                {
                    return CallResult::failure("org.freedesktop.DBus.Error.ObjectPathInUse",
                                               "An advertisement is already exported");
                }

                GError *raw_error = nullptr;
                if (!node_info_)
                {
                    node_info_ = g_dbus_node_info_new_for_xml(ADVERTISEMENT_XML, &raw_error);
                    if (!node_info_)
                    {
                        ErrorPtr error(raw_error);
                        return result_from_error(error.get());
                    }
                }

                GDBusInterfaceInfo *interface = g_dbus_node_info_lookup_interface(node_info_, LE_ADVERTISEMENT_INTERFACE);

                static const GDBusInterfaceVTable vtable = {
                    &GioAdvertisingBackend::on_method_call,
                    &GioAdvertisingBackend::on_get_property,
                    &GioAdvertisingBackend::on_set_property,
                    {nullptr}};

                advertisement_ = &adv;
                registration_id_ = g_dbus_connection_register_object(
                    connection_, adv.object_path().c_str(), interface, &vtable, this, nullptr, &raw_error);

                if (!registration_id_)
                {
                    ErrorPtr error(raw_error);
                    advertisement_ = nullptr;
                    auto result = result_from_error(error.get());
                    logger_->error("Failed to export advertisement",
                                   core::LogContext{}.add("path", adv.object_path()).add("error", result.error_message));
                    return result;
                }

                logger_->debug("Exported advertisement object", core::LogContext{}.add("path", adv.object_path()));
                return CallResult::success();
            }

            void unexport_advertisement() override
            {
                if (connection_ && registration_id_)
                {
                    g_dbus_connection_unregister_object(connection_, registration_id_);
                    logger_->debug("Unexported advertisement object");
                }
                registration_id_ = 0;
                advertisement_ = nullptr;
            }

            CallResult request_name(const std::string &bus_name) override
            {
                VariantPtr reply;
                CallResult result = call(DBUS_SERVICE, DBUS_PATH, DBUS_INTERFACE, "RequestName",
                                         g_variant_new("(su)", bus_name.c_str(), 0u),
                                         G_VARIANT_TYPE("(u)"), reply);
                if (!result.ok)
                {
                    return result;
                }

                guint32 code = 0;
                g_variant_get(reply.get(), "(u)", &code);
                logger_->debug("RequestName replied", core::LogContext{}.add("name", bus_name).add("code", code));

                // 1 = primary owner, 4 = already owner
                if (code != 1 && code != 4)
                {
                    return CallResult::failure("org.freedesktop.DBus.Error.Failed",
                                               "RequestName returned " + std::to_string(code));
                }
                return CallResult::success();
            }

            CallResult get_managed_objects(nlohmann::json &objects) override
            {
                VariantPtr reply;
                CallResult result = call(BLUEZ_SERVICE, "/", OBJECT_MANAGER_INTERFACE, "GetManagedObjects",
                                         nullptr, G_VARIANT_TYPE("(a{oa{sa{sv}}})"), reply);
                if (result.ok)
                {
                    objects = unpack_managed_objects(reply.get());
                }
                return result;
            }

            CallResult set_adapter_powered(const std::string &adapter_path, bool powered) override
            {
                VariantPtr reply;
                return call(BLUEZ_SERVICE, adapter_path.c_str(), PROPERTIES_INTERFACE, "Set",
                            g_variant_new("(ssv)", ADAPTER_INTERFACE, "Powered", g_variant_new_boolean(powered)),
                            nullptr, reply);
            }

            CallResult register_advertisement(const std::string &adapter_path, const std::string &object_path) override
            {
                GVariant *options = g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0);
                VariantPtr reply;
                return call(BLUEZ_SERVICE, adapter_path.c_str(), LE_ADVERTISING_MANAGER_INTERFACE, "RegisterAdvertisement",
                            g_variant_new("(o@a{sv})", object_path.c_str(), options), nullptr, reply);
            }

            CallResult unregister_advertisement(const std::string &adapter_path, const std::string &object_path) override
            {
                VariantPtr reply;
                return call(BLUEZ_SERVICE, adapter_path.c_str(), LE_ADVERTISING_MANAGER_INTERFACE, "UnregisterAdvertisement",
                            g_variant_new("(o)", object_path.c_str()), nullptr, reply);
            }

            void run() override
            {
                if (quit_requested_ || !is_connected())
                {
                    return;
                }

                if (!loop_)
                {
                    loop_ = g_main_loop_new(nullptr, FALSE);
                }
                g_main_loop_run(loop_);
            }

            void quit() override
            {
                quit_requested_ = true;
                if (loop_ && g_main_loop_is_running(loop_))
                {
                    g_main_loop_quit(loop_);
                }
            }

        private:
            CallResult call(const char *destination, const char *path, const char *interface, const char *method,
                            GVariant *parameters, const GVariantType *reply_type, VariantPtr &reply)
            {
                if (!is_connected())
                {
                    if (parameters)
                    {
                        g_variant_unref(g_variant_ref_sink(parameters));
                    }
                    return CallResult::failure("org.freedesktop.DBus.Error.Disconnected", "Not connected to the bus");
                }

                logger_->debug("D-Bus call", core::LogContext{}.add("destination", destination).add("path", path).add("method", std::string(interface) + "." + method));

                PendingCall pending;
                g_dbus_connection_call(connection_, destination, path, interface, method, parameters, reply_type,
                                       G_DBUS_CALL_FLAGS_NONE, call_timeout_ms_, nullptr, &on_call_finished, &pending);

                while (!pending.done)
                {
                    g_main_context_iteration(nullptr, TRUE);
                }

                ErrorPtr error(pending.error);
                reply.reset(pending.reply);
                if (!pending.reply)
                {
                    return result_from_error(error.get());
                }
                return CallResult::success();
            }

            static void on_closed(GDBusConnection *, gboolean remote_peer_vanished, GError *, gpointer user_data)
            {
                auto *self = static_cast<GioAdvertisingBackend *>(user_data);
                self->logger_->warning("System bus connection closed",
                                       core::LogContext{}.add("remote_peer_vanished", remote_peer_vanished ? "true" : "false"));
                self->quit();
            }

            static void on_method_call(GDBusConnection *, const gchar *sender, const gchar *, const gchar *,
                                       const gchar *method, GVariant *, GDBusMethodInvocation *invocation,
                                       gpointer user_data)
            {
                auto *self = static_cast<GioAdvertisingBackend *>(user_data);

                if (g_strcmp0(method, "Release") == 0 && self->advertisement_)
                {
                    self->logger_->debug("Release received", core::LogContext{}.add("sender", sender));
                    g_dbus_method_invocation_return_value(invocation, nullptr);
                    self->advertisement_->release();
                    return;
                }

                g_dbus_method_invocation_return_dbus_error(invocation, "org.freedesktop.DBus.Error.UnknownMethod",
                                                           "Unknown method");
            }

            static GVariant *on_get_property(GDBusConnection *, const gchar *, const gchar *, const gchar *,
                                             const gchar *property_name, GError **error, gpointer user_data)
            {
                auto *self = static_cast<GioAdvertisingBackend *>(user_data);

                GVariant *value = nullptr;
                if (self->advertisement_)
                {
                    value = advertisement_property(*self->advertisement_, property_name);
                }

                // GetAll skips properties that return nullptr here
                if (!value)
                {
                    g_set_error(error, G_DBUS_ERROR, G_DBUS_ERROR_INVALID_ARGS, "Property %s is not set", property_name);
                }
                return value;
            }

            static gboolean on_set_property(GDBusConnection *connection, const gchar *, const gchar *object_path,
                                            const gchar *interface_name, const gchar *property_name, GVariant *value,
                                            GError **error, gpointer user_data)
            {
                auto *self = static_cast<GioAdvertisingBackend *>(user_data);
                if (!self->advertisement_)
                {
                    g_set_error(error, G_DBUS_ERROR, G_DBUS_ERROR_FAILED, "No advertisement exported");
                    return FALSE;
                }

                std::string reason;
                if (!apply_advertisement_property(*self->advertisement_, property_name, value, reason))
                {
                    self->logger_->warning("Rejected property write",
                                           core::LogContext{}.add("property", property_name).add("reason", reason));
                    g_set_error(error, G_DBUS_ERROR, G_DBUS_ERROR_INVALID_ARGS, "%s", reason.c_str());
                    return FALSE;
                }

                self->logger_->info("Advertisement property updated", core::LogContext{}.add("property", property_name));

                GVariantBuilder changed;
                g_variant_builder_init(&changed, G_VARIANT_TYPE("a{sv}"));
                GVariant *current = advertisement_property(*self->advertisement_, property_name);
                if (current)
                {
                    g_variant_builder_add(&changed, "{sv}", property_name, current);
                }

                GVariantBuilder invalidated;
                g_variant_builder_init(&invalidated, G_VARIANT_TYPE_STRING_ARRAY);
                if (!current)
                {
                    g_variant_builder_add(&invalidated, "s", property_name);
                }

                g_dbus_connection_emit_signal(connection, nullptr, object_path, PROPERTIES_INTERFACE,
                                              "PropertiesChanged",
                                              g_variant_new("(sa{sv}as)", interface_name, &changed, &invalidated),
                                              nullptr);
                return TRUE;
            }

            int call_timeout_ms_;
            std::string bus_address_;
            std::shared_ptr<core::Logger> logger_;

            GDBusConnection *connection_ = nullptr;
            GDBusNodeInfo *node_info_ = nullptr;
            GMainLoop *loop_ = nullptr;
            gulong closed_handler_ = 0;
            bool private_connection_ = false;
            guint registration_id_ = 0;
            bool quit_requested_ = false;

            advertising::Advertisement *advertisement_ = nullptr;
        };

        std::unique_ptr<IAdvertisingBackend> create_gio_backend(const core::AdvertiserConfig &config)
        {
            return std::make_unique<GioAdvertisingBackend>(config);
        }

    } // namespace bluez
} // namespace blueadv
