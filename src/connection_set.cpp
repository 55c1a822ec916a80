// src/connection_set.cpp

#include "connection_set.h"

#include <syslog.h>
#include <exception>
#include <utility>

#include "discovery.h"

namespace GridLink {

DeviceConnectionSet::DeviceConnectionSet(std::shared_ptr<Transport> transport,
                                         std::shared_ptr<Scheduler> scheduler,
                                         const ConnectConfig& config,
                                         HandlerBindings bindings)
    : transport_(std::move(transport)),
      scheduler_(std::move(scheduler)),
      config_(config),
      bindings_(std::move(bindings)),
      registry_(std::make_shared<RegistryCell>(ConnectionRegistry{})),
      shutdown_actions_(std::vector<ShutdownAction>{}) {}

DeviceConnectionSet::~DeviceConnectionSet() {
    syslog(LOG_DEBUG, "Connection set released (%zu sessions, shut down=%d)",
           session_count(), shut_down_.load());
}

std::shared_ptr<DeviceConnectionSet> DeviceConnectionSet::create(std::shared_ptr<Transport> transport,
                                                                 std::shared_ptr<Scheduler> scheduler,
                                                                 const ConnectConfig& config,
                                                                 HandlerBindings bindings) {
    return std::shared_ptr<DeviceConnectionSet>(
        new DeviceConnectionSet(std::move(transport), std::move(scheduler), config, std::move(bindings)));
}

std::shared_ptr<DeviceConnectionSet> DeviceConnectionSet::connect(std::shared_ptr<Transport> transport,
                                                                  std::shared_ptr<Scheduler> scheduler,
                                                                  const ConnectConfig& config,
                                                                  HandlerBindings bindings) {
    auto set = create(std::move(transport), std::move(scheduler), config, std::move(bindings));
    set->start_discovery();
    return set;
}

void DeviceConnectionSet::start_discovery() {
    Discovery::Request request;
    request.host = config_.host;
    request.me = config_.self_address;
    request.port = config_.discovery_port;
    request.window = config_.discovery_window();

    syslog(LOG_INFO, "Listing devices on %s:%d (%zu handler bindings)",
           request.host.c_str(), request.port, bindings_.size());

    std::weak_ptr<DeviceConnectionSet> weak = shared_from_this();
    Discovery::list_devices(*transport_, *scheduler_, request,
        [weak](const DeviceIdentity& device) {
            if (auto self = weak.lock()) {
                self->on_device_found(device);
            }
        });
}

// ===== SESSIONS =====

const HandlerFactory* DeviceConnectionSet::find_binding(const DeviceIdentity& device) const {
    auto it = bindings_.find(device.id);
    if (it == bindings_.end()) {
        it = bindings_.find(device.name);
    }
    return (it != bindings_.end()) ? &it->second : nullptr;
}

void DeviceConnectionSet::on_device_found(const DeviceIdentity& device) {
    if (shut_down_) {
        syslog(LOG_INFO, "Ignoring device %s: connection set is shut down", device.id.c_str());
        return;
    }

    const HandlerFactory* factory = find_binding(device);

    if (factory) {
        SessionOptions options;
        options.me = config_.self_address;
        options.prefix = config_.prefix;

        try {
            auto session = DeviceSession::establish(*transport_, device, options, *factory, registry_);
            register_shutdown([session]() { session->shutdown(); });

            // Lost a race with shutdown_all(): its snapshot may not include us
            if (shut_down_) {
                session->shutdown();
            }
        } catch (const std::exception& e) {
            syslog(LOG_ERR, "Failed to establish session for %s: %s", device.id.c_str(), e.what());
        }
    } else {
        syslog(LOG_INFO, "No handler bound for device %s (%s)", device.id.c_str(), device.name.c_str());
        if (!config_.collect_unbound_properties) {
            return;
        }
    }

    collect_properties(device);
}

void DeviceConnectionSet::collect_properties(const DeviceIdentity& device) {
    Discovery::Request request;
    request.host = device.host;
    request.me = config_.self_address;
    request.port = device.port;
    request.window = config_.discovery_window();

    std::shared_ptr<RegistryCell> registry = registry_;
    std::string device_id = device.id;

    Discovery::list_properties(*transport_, *scheduler_, request,
        [registry, device_id](const DeviceProperty& property) {
            Registry::put_property(*registry, device_id, property);
        });
}

void DeviceConnectionSet::register_shutdown(ShutdownAction action) {
    shutdown_actions_.swap([&action](const std::vector<ShutdownAction>& actions) {
        std::vector<ShutdownAction> next = actions;
        next.push_back(action);
        return next;
    });
}

// ===== CONNECTION SET =====

ConnectionRegistry DeviceConnectionSet::get_state() const {
    return *registry_->deref();
}

void DeviceConnectionSet::shutdown_all() {
    shut_down_ = true;

    auto actions = shutdown_actions_.deref();
    syslog(LOG_INFO, "Shutting down %zu sessions", actions->size());

    for (const auto& action : *actions) {
        action();
    }
}

nlohmann::json DeviceConnectionSet::describe() const {
    return Registry::to_json(get_state());
}

size_t DeviceConnectionSet::session_count() const {
    return shutdown_actions_.deref()->size();
}

} // namespace GridLink
