// src/device_session.cpp

#include "device_session.h"

#include <syslog.h>
#include <exception>
#include <stdexcept>
#include <utility>

namespace GridLink {

using State::SessionFlags::CLOSED;
using State::SessionFlags::HANDLER_ERROR;
using State::SessionFlags::INITIALIZED;
using State::SessionFlags::LISTENING;
using State::SessionFlags::NEGOTIATED;
using State::SessionFlags::OPENED;
using State::SessionFlags::SHUTDOWN_REQUESTED;

// ===== CONNECTION INFO =====

Transmitter& DeviceSession::SessionConnectionInfo::get_transmitter() {
    return *session_.transmitter_;
}

std::string DeviceSession::SessionConnectionInfo::get_prefix() const {
    return session_.options_.prefix;
}

std::set<std::string> DeviceSession::SessionConnectionInfo::get_keys() const {
    auto registry = session_.registry_->deref();
    auto it = registry->find(session_.device_.id);
    if (it == registry->end()) {
        return {};
    }
    return it->second.keys();
}

std::optional<Arguments> DeviceSession::SessionConnectionInfo::get_key(const std::string& key) const {
    auto registry = session_.registry_->deref();
    auto it = registry->find(session_.device_.id);
    if (it == registry->end()) {
        return std::nullopt;
    }

    auto prop = it->second.driver.find(key);
    if (prop == it->second.driver.end()) {
        return std::nullopt;
    }
    return prop->second;
}

void DeviceSession::SessionConnectionInfo::swap_state(const StateUpdate& f) {
    session_.swap_state(f);
}

// ===== LIFECYCLE =====

DeviceSession::DeviceSession(const DeviceIdentity& device, const SessionOptions& options,
                             std::shared_ptr<RegistryCell> registry)
    : device_(device), options_(options), registry_(std::move(registry)), status_(device.id) {
    initialize_event_handlers();
}

DeviceSession::~DeviceSession() {
    // Stop deliveries before the handler and state cell are destroyed
    close_channels();
    syslog(LOG_DEBUG, "Session for %s released %s",
           device_.id.c_str(), status_.describe().c_str());
}

std::shared_ptr<DeviceSession> DeviceSession::establish(Transport& transport,
                                                        const DeviceIdentity& device,
                                                        const SessionOptions& options,
                                                        const HandlerFactory& factory,
                                                        std::shared_ptr<RegistryCell> registry) {
    std::shared_ptr<DeviceSession> session(new DeviceSession(device, options, std::move(registry)));
    std::weak_ptr<DeviceSession> weak = session;

    // The receiver never owns the session; ~DeviceSession closes it first
    DeviceSession* self = session.get();

    session->transmitter_ = transport.start_transmitter(device.host, device.port);
    session->receiver_ = transport.start_receiver(
        [self](const std::string&, const std::string& address, const Arguments& args) {
            self->dispatch(address, args);
        });
    session->status_.state.add_flag(OPENED);

    session->info_ = std::make_unique<SessionConnectionInfo>(*session);
    session->handler_ = factory(*session->info_);
    if (!session->handler_) {
        throw std::runtime_error("Handler binding for " + device.id + " produced no handler");
    }

    session->state_.reset(session->handler_->get_initial_state());
    session->status_.state.add_flag(INITIALIZED);

    session->negotiate();

    Registry::put_handler_state(*session->registry_, device.id, [weak]() -> HandlerState {
        if (auto self = weak.lock()) {
            return self->current_state();
        }
        return HandlerState();
    });

    session->status_.state.add_flag(LISTENING);

    syslog(LOG_INFO, "Session established for %s (%s) at %s:%d, prefix %s, reply port %d",
           device.id.c_str(), device.name.c_str(), device.host.c_str(), device.port,
           options.prefix.c_str(), session->receiver_port());

    return session;
}

void DeviceSession::negotiate() {
    Message host_message(Protocol::Addresses::SYS_HOST);
    host_message.add_string(options_.me);

    Message port_message(Protocol::Addresses::SYS_PORT);
    port_message.add_int(receiver_->port());

    Message prefix_message(Protocol::Addresses::SYS_PREFIX);
    prefix_message.add_string(options_.prefix);

    for (const auto& message : {host_message, port_message, prefix_message}) {
        transmitter_->transmit(message);
    }

    status_.state.add_flag(NEGOTIATED);
}

void DeviceSession::shutdown() {
    if (!status_.state.add_flag(SHUTDOWN_REQUESTED)) {
        syslog(LOG_DEBUG, "Session for %s already shut down", device_.id.c_str());
        return;
    }

    auto state = state_.deref();

    try {
        if (handler_ && state) {
            handler_->shutdown(*state);
        }
    } catch (...) {
        close_channels();
        throw;
    }

    close_channels();
    syslog(LOG_INFO, "Session for %s shut down", device_.id.c_str());
}

void DeviceSession::close_channels() {
    if (receiver_) receiver_->close();
    if (transmitter_) transmitter_->close();
    status_.state.add_flag(CLOSED);
}

int DeviceSession::receiver_port() const {
    return receiver_ ? receiver_->port() : -1;
}

// ===== STATE =====

bool DeviceSession::swap_state(const StateUpdate& f) {
    bool applied = state_.swap([&f](const HandlerState& current) {
        return f(current);
    });

    if (!applied) {
        syslog(LOG_DEBUG, "State update for %s ignored, session not initialised",
               device_.id.c_str());
    }
    return applied;
}

HandlerState DeviceSession::current_state() const {
    auto state = state_.deref();
    return state ? *state : HandlerState();
}

// ===== DISPATCH =====

void DeviceSession::initialize_event_handlers() {
    event_handlers_[Protocol::Events::GRID_KEY] = [this](const Arguments& args) {
        auto values = read_ints(Protocol::Events::GRID_KEY, args, 3);
        if (!values) return false;

        int x = (*values)[0], y = (*values)[1], how = (*values)[2];
        swap_state([this, x, y, how](const HandlerState& state) {
            return handler_->handle_grid_key(state, x, y, how);
        });
        return true;
    };

    event_handlers_[Protocol::Events::ENC_KEY] = [this](const Arguments& args) {
        auto values = read_ints(Protocol::Events::ENC_KEY, args, 2);
        if (!values) return false;

        int enc = (*values)[0], how = (*values)[1];
        swap_state([this, enc, how](const HandlerState& state) {
            return handler_->handle_enc_key(state, enc, how);
        });
        return true;
    };

    event_handlers_[Protocol::Events::ENC_DELTA] = [this](const Arguments& args) {
        auto values = read_ints(Protocol::Events::ENC_DELTA, args, 2);
        if (!values) return false;

        int enc = (*values)[0], delta = (*values)[1];
        swap_state([this, enc, delta](const HandlerState& state) {
            return handler_->handle_enc_delta(state, enc, delta);
        });
        return true;
    };
}

void DeviceSession::dispatch(const std::string& address, const Arguments& args) {
    auto event = Protocol::strip_prefix(address, options_.prefix);
    auto it = event ? event_handlers_.find(*event) : event_handlers_.end();

    if (it == event_handlers_.end()) {
        status_.events_unrecognized.fetch_add(1);
        syslog(LOG_WARNING, "Other message for %s: %s %s",
               device_.id.c_str(), address.c_str(), Args::describe(args).c_str());
        return;
    }

    syslog(LOG_DEBUG, "Event %s %s for %s",
           it->first.c_str(), Args::describe(args).c_str(), device_.id.c_str());

    try {
        if (it->second(args)) {
            status_.events_dispatched.fetch_add(1);
        }
    } catch (const std::exception& e) {
        status_.events_failed.fetch_add(1);
        status_.state.add_flag(HANDLER_ERROR);
        syslog(LOG_ERR, "Handler failed on %s for %s: %s",
               address.c_str(), device_.id.c_str(), e.what());
    }
}

std::optional<std::vector<int>> DeviceSession::read_ints(const char* event, const Arguments& args,
                                                         size_t count) {
    std::vector<int> values;
    try {
        for (size_t i = 0; i < count; ++i) {
            values.push_back(Args::get_int(args, i));
        }
    } catch (const std::exception& e) {
        status_.events_failed.fetch_add(1);
        syslog(LOG_WARNING, "Malformed %s for %s %s: %s",
               event, device_.id.c_str(), Args::describe(args).c_str(), e.what());
        return std::nullopt;
    }
    return values;
}

} // namespace GridLink
