// include/connection_set.h
// Discovers devices, builds a session for each bound one, tears them all down

#ifndef GRIDLINK_CONNECTION_SET_H
#define GRIDLINK_CONNECTION_SET_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "atomic_cell.h"
#include "config.h"
#include "connection.h"
#include "connection_registry.h"
#include "device_session.h"
#include "scheduler.h"
#include "transport.h"

namespace GridLink {

/**
 * Connection set over every device found by one discovery broadcast
 *
 * Sessions are created from discovery callbacks on transport threads. The
 * registry and the shutdown list are atomic cells, so concurrent session
 * establishment never takes a shared lock.
 */
class DeviceConnectionSet : public ConnectionSet,
                            public std::enable_shared_from_this<DeviceConnectionSet> {
public:
    using ShutdownAction = std::function<void()>;

private:
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<Scheduler> scheduler_;
    ConnectConfig config_;
    HandlerBindings bindings_;

    std::shared_ptr<RegistryCell> registry_;
    AtomicCell<std::vector<ShutdownAction>> shutdown_actions_;
    std::atomic<bool> shut_down_{false};

    DeviceConnectionSet(std::shared_ptr<Transport> transport,
                        std::shared_ptr<Scheduler> scheduler,
                        const ConnectConfig& config,
                        HandlerBindings bindings);

public:
    /**
     * Look for devices and connect every one with a handler binding.
     * Returns immediately; sessions appear as discovery replies arrive.
     */
    static std::shared_ptr<DeviceConnectionSet> connect(std::shared_ptr<Transport> transport,
                                                        std::shared_ptr<Scheduler> scheduler,
                                                        const ConnectConfig& config,
                                                        HandlerBindings bindings);

    /**
     * Same, without broadcasting. Devices are fed in via on_device_found().
     */
    static std::shared_ptr<DeviceConnectionSet> create(std::shared_ptr<Transport> transport,
                                                       std::shared_ptr<Scheduler> scheduler,
                                                       const ConnectConfig& config,
                                                       HandlerBindings bindings);

    ~DeviceConnectionSet() override;

    ConnectionRegistry get_state() const override;

    /**
     * Run every registered shutdown action in registration order. The first
     * exception propagates. Discoveries arriving afterwards are ignored.
     */
    void shutdown_all() override;

    /**
     * Handle one discovered device: establish a session if a binding exists
     * (by id, then by name) and start collecting its driver properties
     */
    void on_device_found(const DeviceIdentity& device);

    /**
     * Snapshot as JSON: driver properties and session presence per device
     */
    nlohmann::json describe() const;

    size_t session_count() const;

    bool is_shut_down() const {
        return shut_down_;
    }

private:
    void start_discovery();

    const HandlerFactory* find_binding(const DeviceIdentity& device) const;

    void register_shutdown(ShutdownAction action);

    void collect_properties(const DeviceIdentity& device);
};

} // namespace GridLink

#endif // GRIDLINK_CONNECTION_SET_H
