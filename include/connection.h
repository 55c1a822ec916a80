// include/connection.h
// Capability sets exchanged between the connection core and device handlers

#ifndef GRIDLINK_CONNECTION_H
#define GRIDLINK_CONNECTION_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "connection_registry.h"
#include "message.h"
#include "transport.h"

namespace GridLink {

using StateUpdate = std::function<HandlerState(const HandlerState&)>;

/**
 * Information and callbacks handed to a handler when its session is built
 */
class ConnectionInfo {
public:
    virtual ~ConnectionInfo() = default;

    // Transmitter to the device; already negotiated host/port/prefix
    virtual Transmitter& get_transmitter() = 0;

    // Available without waiting for driver interrogation
    virtual std::string get_prefix() const = 0;

    // Driver property keys received so far (/sys/...)
    virtual std::set<std::string> get_keys() const = 0;

    virtual std::optional<Arguments> get_key(const std::string& key) const = 0;

    /**
     * Apply f to the session state. A no-op until the initial state is in
     * place.
     */
    virtual void swap_state(const StateUpdate& f) = 0;
};

/**
 * Handler for one device. Each handle_* call receives the current state and
 * returns the next one.
 */
class ConnectionClient {
public:
    virtual ~ConnectionClient() = default;

    virtual HandlerState get_initial_state() = 0;

    virtual HandlerState handle_grid_key(const HandlerState& state, int x, int y, int how) = 0;

    virtual HandlerState handle_enc_key(const HandlerState& state, int enc, int how) = 0;

    virtual HandlerState handle_enc_delta(const HandlerState& state, int enc, int delta) = 0;

    // Shut down any other connections or activity
    virtual void shutdown(const HandlerState& state) = 0;
};

/**
 * Handler binding: builds a handler once the session info exists. The info
 * outlives the handler.
 */
using HandlerFactory = std::function<std::unique_ptr<ConnectionClient>(ConnectionInfo&)>;

// Keyed by device id or device name; id wins
using HandlerBindings = std::map<std::string, HandlerFactory>;

/**
 * All the current connections
 */
class ConnectionSet {
public:
    virtual ~ConnectionSet() = default;

    // Instantaneous snapshot of per-device properties and state accessors
    virtual ConnectionRegistry get_state() const = 0;

    // Shut down all handlers and channels, in registration order
    virtual void shutdown_all() = 0;
};

} // namespace GridLink

#endif // GRIDLINK_CONNECTION_H
