// src/discovery.cpp

#include "discovery.h"

#include <syslog.h>
#include <exception>
#include <memory>

namespace GridLink {
namespace Discovery {

namespace {

    // Transmitter/receiver pair released together when the window closes
    struct Channel {
        std::unique_ptr<Transmitter> transmitter;
        std::unique_ptr<Receiver> receiver;

        void close() {
            if (transmitter) transmitter->close();
            if (receiver) receiver->close();
        }
    };

    /**
     * Open a channel, send `address` carrying (me, reply port), and schedule
     * the channel's release after the window
     */
    void broadcast(Transport& transport, Scheduler& scheduler, const Request& request,
                   const char* address, DispatchFn dispatch) {
        auto channel = std::make_shared<Channel>();
        channel->transmitter = transport.start_transmitter(request.host, request.port);
        channel->receiver = transport.start_receiver(std::move(dispatch));

        Message message(address);
        message.add_string(request.me)
               .add_int(channel->receiver->port());

        channel->transmitter->transmit(message);

        syslog(LOG_DEBUG, "Sent %s to %s:%d, replies on port %d for %lldms",
               address, request.host.c_str(), request.port,
               channel->receiver->port(), static_cast<long long>(request.window.count()));

        scheduler.schedule_after(request.window, [channel]() {
            channel->close();
        });
    }

} // namespace

void list_devices(Transport& transport, Scheduler& scheduler,
                  const Request& request, DeviceCallback callback) {
    std::string host = request.host;

    auto dispatch = [host, callback](const std::string&, const std::string& address,
                                     const Arguments& args) {
        if (address != Protocol::Addresses::DEVICE) {
            return;
        }

        DeviceIdentity device;
        try {
            device.id = Args::get_string(args, 0);
            device.name = Args::get_string(args, 1);
            device.host = host;
            device.port = Args::get_int(args, 2);
        } catch (const std::exception& e) {
            syslog(LOG_WARNING, "Malformed %s reply %s: %s",
                   address.c_str(), Args::describe(args).c_str(), e.what());
            return;
        }

        syslog(LOG_INFO, "Discovered device %s (%s) at %s:%d",
               device.id.c_str(), device.name.c_str(), device.host.c_str(), device.port);

        try {
            callback(device);
        } catch (const std::exception& e) {
            syslog(LOG_ERR, "Device callback failed for %s: %s", device.id.c_str(), e.what());
        }
    };

    broadcast(transport, scheduler, request, Protocol::Addresses::LIST_DEVICES, dispatch);
}

void list_properties(Transport& transport, Scheduler& scheduler,
                     const Request& request, PropertyCallback callback) {
    auto dispatch = [callback](const std::string&, const std::string& address,
                               const Arguments& args) {
        syslog(LOG_DEBUG, "Property %s = %s", address.c_str(), Args::describe(args).c_str());

        try {
            callback(DeviceProperty{address, args});
        } catch (const std::exception& e) {
            syslog(LOG_ERR, "Property callback failed for %s: %s", address.c_str(), e.what());
        }
    };

    broadcast(transport, scheduler, request, Protocol::Addresses::SYS_INFO, dispatch);
}

} // namespace Discovery
} // namespace GridLink
