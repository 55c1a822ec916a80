// include/connection_registry.h
// Per-device registry shared by every session of a connection set

#ifndef GRIDLINK_CONNECTION_REGISTRY_H
#define GRIDLINK_CONNECTION_REGISTRY_H

#include <any>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "atomic_cell.h"
#include "message.h"

namespace GridLink {

/**
 * Opaque handler state. Produced by a handler's initializer and threaded
 * through every later handler call.
 */
using HandlerState = std::any;

using HandlerStateFn = std::function<HandlerState()>;

/**
 * Registry entry for one device
 */
struct DeviceEntry {
    // Driver properties keyed by protocol address ("/sys/size" -> [16, 8])
    std::map<std::string, Arguments> driver;

    // Snapshot accessor for the session's current state; empty when no
    // session was established for this device
    HandlerStateFn handler_state;

    std::set<std::string> keys() const {
        std::set<std::string> result;
        for (const auto& [key, value] : driver) {
            result.insert(key);
        }
        return result;
    }

    bool has_session() const {
        return static_cast<bool>(handler_state);
    }
};

using ConnectionRegistry = std::map<std::string, DeviceEntry>;
using RegistryCell = AtomicCell<ConnectionRegistry>;

namespace Registry {

    /**
     * Store one driver property, leaving every other entry untouched
     */
    inline void put_property(RegistryCell& cell, const std::string& device_id,
                             const DeviceProperty& property) {
        cell.swap([&](const ConnectionRegistry& registry) {
            ConnectionRegistry next = registry;
            next[device_id].driver[property.key] = property.value;
            return next;
        });
    }

    inline void put_handler_state(RegistryCell& cell, const std::string& device_id,
                                  HandlerStateFn accessor) {
        cell.swap([&](const ConnectionRegistry& registry) {
            ConnectionRegistry next = registry;
            next[device_id].handler_state = accessor;
            return next;
        });
    }

    inline nlohmann::json to_json(const Argument& arg) {
        if (const auto* i = std::get_if<int32_t>(&arg)) return *i;
        if (const auto* f = std::get_if<float>(&arg)) return *f;
        return std::get<std::string>(arg);
    }

    /**
     * Render a snapshot for logs and status output. A single-element
     * property becomes a scalar, longer ones an array.
     */
    inline nlohmann::json to_json(const ConnectionRegistry& registry) {
        nlohmann::json result = nlohmann::json::object();

        for (const auto& [device_id, entry] : registry) {
            nlohmann::json driver = nlohmann::json::object();
            for (const auto& [key, value] : entry.driver) {
                if (value.size() == 1) {
                    driver[key] = to_json(value.front());
                } else {
                    nlohmann::json values = nlohmann::json::array();
                    for (const auto& arg : value) {
                        values.push_back(to_json(arg));
                    }
                    driver[key] = values;
                }
            }

            result[device_id] = {
                {"driver", driver},
                {"session", entry.has_session()},
            };
        }

        return result;
    }

} // namespace Registry

} // namespace GridLink

#endif // GRIDLINK_CONNECTION_REGISTRY_H
