// test/fake_transport.h
// In-memory transport: records every transmission, delivers replies synchronously

#ifndef GRIDLINK_TEST_FAKE_TRANSPORT_H
#define GRIDLINK_TEST_FAKE_TRANSPORT_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "transport.h"

namespace GridLink {
namespace Testing {

class FakeTransport : public Transport {
public:
    struct Sent {
        std::string host;
        int port;
        Message message;
    };

    // Runs after a transmission is recorded, with no transport lock held
    using TransmitHook = std::function<void(const Sent&)>;

private:
    struct Endpoint {
        int port;
        DispatchFn dispatch;
        bool open = true;
        std::recursive_mutex mutex;

        // Set while a callback runs; guarded by mutex
        bool dispatching = false;
        std::thread::id dispatch_thread;
        size_t closed_in_callback = 0;
    };

    struct Outbound {
        std::string host;
        int port;
        bool open = true;
    };

    class FakeTransmitter : public Transmitter {
    private:
        FakeTransport& transport_;
        std::shared_ptr<Outbound> outbound_;

    public:
        FakeTransmitter(FakeTransport& transport, std::shared_ptr<Outbound> outbound)
            : transport_(transport), outbound_(std::move(outbound)) {}

        ~FakeTransmitter() override { close(); }

        void transmit(const Message& message) override {
            transport_.record(*outbound_, message);
        }

        void close() override {
            std::lock_guard<std::mutex> lock(transport_.mutex_);
            outbound_->open = false;
        }
    };

    class FakeReceiver : public Receiver {
    private:
        std::shared_ptr<Endpoint> endpoint_;

    public:
        explicit FakeReceiver(std::shared_ptr<Endpoint> endpoint) : endpoint_(std::move(endpoint)) {}

        ~FakeReceiver() override { close(); }

        int port() const override { return endpoint_->port; }

        // Waits for a callback running on another thread, like a socket
        // receiver joining its listener
        void close() override {
            std::lock_guard<std::recursive_mutex> lock(endpoint_->mutex);
            if (endpoint_->dispatching && endpoint_->dispatch_thread == std::this_thread::get_id()) {
                endpoint_->closed_in_callback++;
            }
            endpoint_->open = false;
        }
    };

    mutable std::mutex mutex_;
    std::vector<Sent> sent_;
    std::vector<std::shared_ptr<Outbound>> transmitters_;
    std::map<int, std::shared_ptr<Endpoint>> receivers_;
    TransmitHook hook_;
    int next_port_ = 20000;
    int last_receiver_port_ = -1;

    void record(const Outbound& outbound, const Message& message) {
        Sent sent{outbound.host, outbound.port, message};
        TransmitHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!outbound.open) {
                throw std::runtime_error("Transmit on closed transmitter to " + outbound.host);
            }
            sent_.push_back(sent);
            hook = hook_;
        }

        if (hook) {
            hook(sent);
        }
    }

public:
    std::unique_ptr<Transmitter> start_transmitter(const std::string& host, int port) override {
        auto outbound = std::make_shared<Outbound>();
        outbound->host = host;
        outbound->port = port;

        std::lock_guard<std::mutex> lock(mutex_);
        transmitters_.push_back(outbound);
        return std::make_unique<FakeTransmitter>(*this, outbound);
    }

    std::unique_ptr<Receiver> start_receiver(DispatchFn dispatch) override {
        auto endpoint = std::make_shared<Endpoint>();
        endpoint->dispatch = std::move(dispatch);

        std::lock_guard<std::mutex> lock(mutex_);
        endpoint->port = next_port_++;
        receivers_[endpoint->port] = endpoint;
        last_receiver_port_ = endpoint->port;
        return std::make_unique<FakeReceiver>(endpoint);
    }

    void on_transmit(TransmitHook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    /**
     * Simulate an inbound message on a receiver port
     * @return false if no open receiver listens there
     */
    bool deliver(int port, const std::string& sender, const std::string& address,
                 const Arguments& args = {}) {
        std::shared_ptr<Endpoint> endpoint;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = receivers_.find(port);
            if (it == receivers_.end()) {
                return false;
            }
            endpoint = it->second;
        }

        std::lock_guard<std::recursive_mutex> lock(endpoint->mutex);
        if (!endpoint->open) {
            return false;
        }

        endpoint->dispatching = true;
        endpoint->dispatch_thread = std::this_thread::get_id();
        try {
            endpoint->dispatch(sender, address, args);
        } catch (...) {
            endpoint->dispatching = false;
            throw;
        }
        endpoint->dispatching = false;
        return true;
    }

    std::vector<Sent> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::vector<Sent> sent_to(const std::string& host, int port) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Sent> result;
        for (const auto& s : sent_) {
            if (s.host == host && s.port == port) {
                result.push_back(s);
            }
        }
        return result;
    }

    std::vector<Sent> sent_with(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Sent> result;
        for (const auto& s : sent_) {
            if (s.message.address() == address) {
                result.push_back(s);
            }
        }
        return result;
    }

    bool is_open(int receiver_port) const {
        std::shared_ptr<Endpoint> endpoint;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = receivers_.find(receiver_port);
            if (it == receivers_.end()) {
                return false;
            }
            endpoint = it->second;
        }

        std::lock_guard<std::recursive_mutex> lock(endpoint->mutex);
        return endpoint->open;
    }

    size_t open_receivers() const {
        std::vector<std::shared_ptr<Endpoint>> endpoints;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [port, endpoint] : receivers_) {
                endpoints.push_back(endpoint);
            }
        }

        size_t count = 0;
        for (const auto& endpoint : endpoints) {
            std::lock_guard<std::recursive_mutex> lock(endpoint->mutex);
            if (endpoint->open) ++count;
        }
        return count;
    }

    size_t open_transmitters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& outbound : transmitters_) {
            if (outbound->open) ++count;
        }
        return count;
    }

    /**
     * Receivers closed from inside their own callback. A socket receiver
     * would deadlock or throw there.
     */
    size_t closes_from_callback() const {
        std::vector<std::shared_ptr<Endpoint>> endpoints;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [port, endpoint] : receivers_) {
                endpoints.push_back(endpoint);
            }
        }

        size_t count = 0;
        for (const auto& endpoint : endpoints) {
            std::lock_guard<std::recursive_mutex> lock(endpoint->mutex);
            count += endpoint->closed_in_callback;
        }
        return count;
    }

    int last_receiver_port() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_receiver_port_;
    }
};

} // namespace Testing
} // namespace GridLink

#endif // GRIDLINK_TEST_FAKE_TRANSPORT_H
