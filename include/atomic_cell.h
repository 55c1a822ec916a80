// include/atomic_cell.h
// Lock-free value cell: immutable snapshots published with compare-and-swap

#ifndef GRIDLINK_ATOMIC_CELL_H
#define GRIDLINK_ATOMIC_CELL_H

#include <atomic>
#include <memory>
#include <utility>

namespace GridLink {

/**
 * Holds an immutable value behind a shared_ptr. Readers take a snapshot,
 * writers build a new value from the current one and publish it with CAS,
 * retrying if another writer got there first.
 *
 * An empty cell stays empty under swap(); only reset() initialises it.
 */
template <typename T>
class AtomicCell {
private:
    std::shared_ptr<const T> value_;

public:
    AtomicCell() = default;

    explicit AtomicCell(T initial)
        : value_(std::make_shared<const T>(std::move(initial))) {}

    AtomicCell(const AtomicCell&) = delete;
    AtomicCell& operator=(const AtomicCell&) = delete;

    /**
     * Current snapshot, nullptr while the cell is empty
     */
    std::shared_ptr<const T> deref() const {
        return std::atomic_load(&value_);
    }

    bool has_value() const {
        return deref() != nullptr;
    }

    void reset(T value) {
        std::atomic_store(&value_, std::make_shared<const T>(std::move(value)));
    }

    void clear() {
        std::atomic_store(&value_, std::shared_ptr<const T>());
    }

    /**
     * Replace the value with f(current). f may run more than once under
     * contention and must not have side effects that depend on running once.
     * @return false if the cell was empty and nothing was applied
     */
    template <typename F>
    bool swap(F&& f) {
        std::shared_ptr<const T> current = std::atomic_load(&value_);

        for (;;) {
            if (!current) {
                return false;
            }

            auto next = std::make_shared<const T>(f(*current));

            if (std::atomic_compare_exchange_weak(&value_, &current, next)) {
                return true;
            }
        }
    }
};

} // namespace GridLink

#endif // GRIDLINK_ATOMIC_CELL_H
