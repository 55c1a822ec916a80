// include/bitflag_state.h
// Bit-position flag set with change listeners, backed by Boost cpp_int

#ifndef GRIDLINK_BITFLAG_STATE_H
#define GRIDLINK_BITFLAG_STATE_H

#include <boost/multiprecision/cpp_int.hpp>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace GridLink {
namespace State {

    using boost::multiprecision::cpp_int;

    inline cpp_int bit(int position) {
        return cpp_int(1) << position;
    }

    inline bool test_bit(const cpp_int& value, int position) {
        return boost::multiprecision::bit_test(value, static_cast<unsigned>(position));
    }

    inline cpp_int create_mask(std::initializer_list<int> positions) {
        cpp_int mask = 0;
        for (int position : positions) {
            mask |= bit(position);
        }
        return mask;
    }

    inline bool has_all_bits(const cpp_int& value, const cpp_int& mask) {
        return (value & mask) == mask;
    }

/**
 * Flags are bit positions, so the set is not limited to 64 entries.
 *
 * Listeners get (old, new) after every real change. Flag actions run with the
 * lock held (it is recursive) and may change further flags.
 */
class BitFlagStateMachine {
public:
    using Listener = std::function<void(const cpp_int& old_state, const cpp_int& new_state)>;

private:
    std::string name_;
    cpp_int flags_;
    mutable std::recursive_mutex mutex_;

    std::vector<Listener> listeners_;

    // (bit, set?) -> actions
    std::map<std::pair<int, bool>, std::vector<Listener>> actions_;

public:
    explicit BitFlagStateMachine(std::string name) : name_(std::move(name)) {}

    bool has_flag(int position) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return test_bit(flags_, position);
    }

    bool has_all_flags(std::initializer_list<int> positions) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return has_all_bits(flags_, create_mask(positions));
    }

    cpp_int get_state() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return flags_;
    }

    const std::string& name() const {
        return name_;
    }

    /**
     * Test-and-set
     * @return false if the flag was already set
     */
    bool add_flag(int position) {
        return change(position, true);
    }

    bool remove_flag(int position) {
        return change(position, false);
    }

    void add_global_listener(Listener listener) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    void on_flag_added(int position, Listener action) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        actions_[{position, true}].push_back(std::move(action));
    }

    /**
     * "[opened, listening]" for the flags that are set and have a name
     */
    std::string describe_flags(const std::map<int, std::string>& names) const {
        cpp_int flags = get_state();
        std::string result;

        for (const auto& [position, label] : names) {
            if (!test_bit(flags, position)) continue;
            result += result.empty() ? label : ", " + label;
        }

        return "[" + result + "]";
    }

private:
    bool change(int position, bool set) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        if (test_bit(flags_, position) == set) {
            return false;
        }

        cpp_int old_flags = flags_;
        if (set) {
            boost::multiprecision::bit_set(flags_, static_cast<unsigned>(position));
        } else {
            boost::multiprecision::bit_unset(flags_, static_cast<unsigned>(position));
        }
        cpp_int new_flags = flags_;

        for (const auto& listener : listeners_) {
            listener(old_flags, new_flags);
        }

        auto it = actions_.find({position, set});
        if (it != actions_.end()) {
            // Copy: an action may register further actions
            std::vector<Listener> pending = it->second;
            for (const auto& action : pending) {
                action(old_flags, new_flags);
            }
        }

        return true;
    }
};

} // namespace State
} // namespace GridLink

#endif // GRIDLINK_BITFLAG_STATE_H
