// include/session_state.h
// Session lifecycle flags and event counters

#ifndef GRIDLINK_SESSION_STATE_H
#define GRIDLINK_SESSION_STATE_H

#include <syslog.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include "bitflag_state.h"

namespace GridLink {
namespace State {

    /**
    * Session lifecycle flags (bit positions)
    */
    namespace SessionFlags {
        // Establishment (bits 0-7)
        constexpr int OPENED               = 0;   // transmitter + receiver open
        constexpr int INITIALIZED          = 1;   // handler state cell set
        constexpr int NEGOTIATED           = 2;   // host/port/prefix sent
        constexpr int LISTENING            = 3;   // dispatch accepted

        // Teardown (bits 8-15)
        constexpr int SHUTDOWN_REQUESTED   = 8;
        constexpr int CLOSED               = 9;

        // Errors (bits 16-23)
        constexpr int HANDLER_ERROR        = 16;

        inline const std::map<int, std::string>& names() {
            static const std::map<int, std::string> flag_names = {
                {OPENED, "opened"},
                {INITIALIZED, "initialized"},
                {NEGOTIATED, "negotiated"},
                {LISTENING, "listening"},
                {SHUTDOWN_REQUESTED, "shutdown_requested"},
                {CLOSED, "closed"},
                {HANDLER_ERROR, "handler_error"},
            };
            return flag_names;
        }

        inline bool is_established(const cpp_int& state) {
            return has_all_bits(state, create_mask({OPENED, INITIALIZED, NEGOTIATED, LISTENING})) &&
                   !test_bit(state, CLOSED);
        }
    }

    /**
    * Per-session status: lifecycle flags plus dispatch counters
    */
    struct SessionStatus {
        std::string device_id;
        BitFlagStateMachine state;

        std::atomic<uint64_t> events_dispatched{0};
        std::atomic<uint64_t> events_unrecognized{0};
        std::atomic<uint64_t> events_failed{0};

        explicit SessionStatus(const std::string& id)
            : device_id(id), state("session-" + id) {
            setup_transitions();
        }

        void setup_transitions() {
            state.on_flag_added(SessionFlags::CLOSED, [this](const cpp_int&, const cpp_int&) {
                state.remove_flag(SessionFlags::LISTENING);
            });

            state.on_flag_added(SessionFlags::HANDLER_ERROR, [this](const cpp_int&, const cpp_int&) {
                syslog(LOG_WARNING, "Handler for device %s raised an error", device_id.c_str());
            });
        }

        bool is_established() const {
            return SessionFlags::is_established(state.get_state());
        }

        std::string describe() const {
            return state.describe_flags(SessionFlags::names());
        }
    };

} // namespace State
} // namespace GridLink

#endif // GRIDLINK_SESSION_STATE_H
