// include/device_session.h
// One negotiated channel to a device, its handler and its state cell
// Uses a handler map keyed by the prefix-stripped event address

#ifndef GRIDLINK_DEVICE_SESSION_H
#define GRIDLINK_DEVICE_SESSION_H

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "atomic_cell.h"
#include "connection.h"
#include "connection_registry.h"
#include "message.h"
#include "protocol.h"
#include "session_state.h"
#include "transport.h"

namespace GridLink {

struct SessionOptions {
    std::string me;                                // our address, sent as /sys/host
    std::string prefix = Protocol::Defaults::PREFIX;
};

/**
 * Device Session - negotiates with one device and routes its events
 *
 * The receiver is opened before the handler exists, so events can arrive
 * while the session is still being built. Until the initial state is in
 * place every state update is a no-op.
 */
class DeviceSession {
private:
    // Returns false when the arguments are malformed
    using EventHandler = std::function<bool(const Arguments&)>;

    /**
     * ConnectionInfo handed to the handler factory, bound to this session
     * and to the device's registry entry
     */
    class SessionConnectionInfo : public ConnectionInfo {
    private:
        DeviceSession& session_;

    public:
        explicit SessionConnectionInfo(DeviceSession& session) : session_(session) {}

        Transmitter& get_transmitter() override;
        std::string get_prefix() const override;
        std::set<std::string> get_keys() const override;
        std::optional<Arguments> get_key(const std::string& key) const override;
        void swap_state(const StateUpdate& f) override;
    };

    DeviceIdentity device_;
    SessionOptions options_;
    std::shared_ptr<RegistryCell> registry_;
    State::SessionStatus status_;

    std::unique_ptr<Transmitter> transmitter_;
    std::unique_ptr<Receiver> receiver_;

    // Declared before handler_ so it outlives it
    std::unique_ptr<SessionConnectionInfo> info_;
    std::unique_ptr<ConnectionClient> handler_;

    AtomicCell<HandlerState> state_;

    // Handler map - O(1) dispatch on the stripped address
    std::unordered_map<std::string, EventHandler> event_handlers_;

    DeviceSession(const DeviceIdentity& device, const SessionOptions& options,
                  std::shared_ptr<RegistryCell> registry);

public:
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * Open the channel, build the handler, initialise its state, negotiate
     * host/port/prefix and publish the state accessor in the registry.
     * Transport and handler-factory failures propagate.
     */
    static std::shared_ptr<DeviceSession> establish(Transport& transport,
                                                    const DeviceIdentity& device,
                                                    const SessionOptions& options,
                                                    const HandlerFactory& factory,
                                                    std::shared_ptr<RegistryCell> registry);

    /**
     * Route one inbound message. Unknown addresses are logged and ignored.
     */
    void dispatch(const std::string& address, const Arguments& args);

    // No-op while the state cell is uninitialised
    bool swap_state(const StateUpdate& f);

    // Empty HandlerState while uninitialised
    HandlerState current_state() const;

    bool is_initialized() const {
        return state_.has_value();
    }

    /**
     * Notify the handler with the current state, then close transmitter and
     * receiver. Runs at most once; later calls return immediately.
     */
    void shutdown();

    const DeviceIdentity& device() const { return device_; }
    const std::string& prefix() const { return options_.prefix; }
    const State::SessionStatus& status() const { return status_; }

    int receiver_port() const;

private:
    void initialize_event_handlers();

    void negotiate();

    void close_channels();

    std::optional<std::vector<int>> read_ints(const char* event, const Arguments& args,
                                              size_t count);
};

} // namespace GridLink

#endif // GRIDLINK_DEVICE_SESSION_H
