// include/message.h
// Address + typed argument message model shared by discovery and sessions

#ifndef GRIDLINK_MESSAGE_H
#define GRIDLINK_MESSAGE_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace GridLink {

/**
 * One typed message argument. Devices only ever send int32, float32 and
 * string arguments.
 */
using Argument = std::variant<int32_t, float, std::string>;
using Arguments = std::vector<Argument>;

/**
 * Outbound/inbound protocol message: an address plus ordered arguments
 */
class Message {
private:
    std::string address_;
    Arguments args_;

public:
    explicit Message(std::string address) : address_(std::move(address)) {}

    Message(std::string address, Arguments args)
        : address_(std::move(address)), args_(std::move(args)) {}

    Message& add_string(const std::string& value) {
        args_.emplace_back(value);
        return *this;
    }

    Message& add_int(int32_t value) {
        args_.emplace_back(value);
        return *this;
    }

    Message& add_float(float value) {
        args_.emplace_back(value);
        return *this;
    }

    const std::string& address() const { return address_; }
    const Arguments& args() const { return args_; }
    size_t size() const { return args_.size(); }

    bool operator==(const Message& other) const {
        return address_ == other.address_ && args_ == other.args_;
    }
};

// ===== ARGUMENT ACCESS =====

namespace Args {

    inline const Argument& at(const Arguments& args, size_t index) {
        if (index >= args.size()) {
            throw std::out_of_range("Missing argument " + std::to_string(index) +
                                    " (have " + std::to_string(args.size()) + ")");
        }
        return args[index];
    }

    inline int32_t get_int(const Arguments& args, size_t index) {
        const auto* value = std::get_if<int32_t>(&at(args, index));
        if (!value) {
            throw std::invalid_argument("Argument " + std::to_string(index) + " is not an int");
        }
        return *value;
    }

    inline float get_float(const Arguments& args, size_t index) {
        const auto* value = std::get_if<float>(&at(args, index));
        if (!value) {
            throw std::invalid_argument("Argument " + std::to_string(index) + " is not a float");
        }
        return *value;
    }

    inline std::string get_string(const Arguments& args, size_t index) {
        const auto* value = std::get_if<std::string>(&at(args, index));
        if (!value) {
            throw std::invalid_argument("Argument " + std::to_string(index) + " is not a string");
        }
        return *value;
    }

    /**
     * Render arguments for log output, e.g. [3, 5, "m0"]
     */
    inline std::string describe(const Arguments& args) {
        std::string result = "[";
        bool first = true;

        for (const auto& arg : args) {
            if (!first) result += ", ";
            first = false;

            if (const auto* i = std::get_if<int32_t>(&arg)) {
                result += std::to_string(*i);
            } else if (const auto* f = std::get_if<float>(&arg)) {
                result += std::to_string(*f);
            } else {
                result += "\"" + std::get<std::string>(arg) + "\"";
            }
        }

        result += "]";
        return result;
    }

} // namespace Args

// ===== DISCOVERY RESULTS =====

/**
 * A device announced by the discovery service; immutable once reported
 */
struct DeviceIdentity {
    std::string id;
    std::string name;
    std::string host;
    int port = 0;

    bool operator==(const DeviceIdentity& other) const {
        return id == other.id && name == other.name &&
               host == other.host && port == other.port;
    }
};

/**
 * A system property reported by a device. Scalars arrive as a single
 * element; /sys/size arrives as [width, height].
 */
struct DeviceProperty {
    std::string key;
    Arguments value;
};

} // namespace GridLink

#endif // GRIDLINK_MESSAGE_H
