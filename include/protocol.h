// include/protocol.h
// Discovery and session protocol constants

#ifndef GRIDLINK_PROTOCOL_H
#define GRIDLINK_PROTOCOL_H

#include <optional>
#include <string>
#include <string_view>

namespace GridLink {
namespace Protocol {

    // =============================================================================
    // ADDRESSES
    // =============================================================================
    namespace Addresses {
        // Discovery
        constexpr const char* LIST_DEVICES  = "/serialosc/list";    // (self, reply port)
        constexpr const char* DEVICE        = "/serialosc/device";  // (id, name, port)
        constexpr const char* SYS_INFO      = "/sys/info";          // (self, reply port)

        // Negotiation
        constexpr const char* SYS_HOST      = "/sys/host";          // (self)
        constexpr const char* SYS_PORT      = "/sys/port";          // (reply port)
        constexpr const char* SYS_PREFIX    = "/sys/prefix";        // (prefix)
    }

    // =============================================================================
    // EVENTS - addresses after the session prefix is stripped
    // =============================================================================
    namespace Events {
        constexpr const char* GRID_KEY      = "/grid/key";          // (x, y, how)
        constexpr const char* ENC_KEY       = "/enc/key";           // (enc, how)
        constexpr const char* ENC_DELTA     = "/enc/delta";         // (enc, delta)
    }

    // =============================================================================
    // DEFAULTS
    // =============================================================================
    namespace Defaults {
        constexpr int DISCOVERY_PORT        = 12002;
        constexpr int DISCOVERY_WINDOW_MS   = 1000;
        constexpr const char* PREFIX        = "/-";
        constexpr const char* HOST          = "127.0.0.1";
    }

    /**
     * Strip a negotiated prefix from an inbound address.
     * "/-/grid/key" with prefix "/-" yields "/grid/key"; an address outside
     * the prefix namespace yields nullopt. The prefix is '/' plus a name
     * with no trailing '/'; ConnectConfig::validate_config repairs others.
     */
    inline std::optional<std::string> strip_prefix(std::string_view address,
                                                   std::string_view prefix) {
        if (address.size() <= prefix.size()) return std::nullopt;
        if (address.substr(0, prefix.size()) != prefix) return std::nullopt;
        if (address[prefix.size()] != '/') return std::nullopt;
        return std::string(address.substr(prefix.size()));
    }

} // namespace Protocol
} // namespace GridLink

#endif // GRIDLINK_PROTOCOL_H
