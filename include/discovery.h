// include/discovery.h
// Time-boxed broadcast/collect discovery of devices and device properties

#ifndef GRIDLINK_DISCOVERY_H
#define GRIDLINK_DISCOVERY_H

#include <chrono>
#include <functional>
#include <string>
#include "message.h"
#include "protocol.h"
#include "scheduler.h"
#include "transport.h"

namespace GridLink {
namespace Discovery {

    struct Request {
        std::string host;   // host being interrogated
        std::string me;     // our own address, sent so replies find us
        int port = Protocol::Defaults::DISCOVERY_PORT;
        std::chrono::milliseconds window{Protocol::Defaults::DISCOVERY_WINDOW_MS};
    };

    using DeviceCallback = std::function<void(const DeviceIdentity&)>;
    using PropertyCallback = std::function<void(const DeviceProperty&)>;

    /**
     * Send /serialosc/list and report every /serialosc/device reply that
     * arrives within the window. Returns immediately; the transmitter and
     * receiver are closed by the scheduler when the window ends.
     *
     * Reported identities carry request.host and the port from the reply.
     */
    void list_devices(Transport& transport, Scheduler& scheduler,
                      const Request& request, DeviceCallback callback);

    /**
     * Send /sys/info and report every reply within the window as
     * {key: reply address, value: reply arguments}.
     */
    void list_properties(Transport& transport, Scheduler& scheduler,
                         const Request& request, PropertyCallback callback);

} // namespace Discovery
} // namespace GridLink

#endif // GRIDLINK_DISCOVERY_H
