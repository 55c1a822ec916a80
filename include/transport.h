// include/transport.h
// Transport adapter interface consumed by discovery and sessions

#ifndef GRIDLINK_TRANSPORT_H
#define GRIDLINK_TRANSPORT_H

#include <functional>
#include <memory>
#include <string>
#include "message.h"

namespace GridLink {

/**
 * Inbound dispatch callback: (sender address, message address, arguments).
 * A receiver invokes it one message at a time, in arrival order, on a
 * thread of the transport's choosing.
 */
using DispatchFn = std::function<void(const std::string& sender,
                                      const std::string& address,
                                      const Arguments& args)>;

/**
 * Outbound sender bound to one host/port.
 * Destroying a transmitter closes it.
 */
class Transmitter {
public:
    Transmitter() = default;
    virtual ~Transmitter() = default;

    Transmitter(const Transmitter&) = delete;
    Transmitter& operator=(const Transmitter&) = delete;

    virtual void transmit(const Message& message) = 0;

    // Idempotent
    virtual void close() = 0;
};

/**
 * Inbound listener on an ephemeral port.
 * After close() returns no further dispatch callbacks are delivered and a
 * callback already in progress has finished. close() (and the destructor)
 * must therefore not be called from the receiver's own callback.
 */
class Receiver {
public:
    Receiver() = default;
    virtual ~Receiver() = default;

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    virtual int port() const = 0;

    // Idempotent
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual std::unique_ptr<Transmitter> start_transmitter(const std::string& host, int port) = 0;

    virtual std::unique_ptr<Receiver> start_receiver(DispatchFn dispatch) = 0;
};

} // namespace GridLink

#endif // GRIDLINK_TRANSPORT_H
