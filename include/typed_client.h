// include/typed_client.h
// Adapter letting a handler work with a concrete state type

#ifndef GRIDLINK_TYPED_CLIENT_H
#define GRIDLINK_TYPED_CLIENT_H

#include <any>
#include "connection.h"

namespace GridLink {

/**
 * Implement the typed hooks; the adapter converts to and from HandlerState.
 * A state of the wrong type raises std::bad_any_cast, which dispatch logs
 * as a handler error.
 */
template <typename S>
class TypedConnectionClient : public ConnectionClient {
public:
    virtual S initial_state() = 0;
    virtual S on_grid_key(const S& state, int x, int y, int how) = 0;
    virtual S on_enc_key(const S& state, int /*enc*/, int /*how*/) { return state; }
    virtual S on_enc_delta(const S& state, int /*enc*/, int /*delta*/) { return state; }
    virtual void on_shutdown(const S& /*state*/) {}

    HandlerState get_initial_state() override {
        return HandlerState(initial_state());
    }

    HandlerState handle_grid_key(const HandlerState& state, int x, int y, int how) override {
        return HandlerState(on_grid_key(std::any_cast<const S&>(state), x, y, how));
    }

    HandlerState handle_enc_key(const HandlerState& state, int enc, int how) override {
        return HandlerState(on_enc_key(std::any_cast<const S&>(state), enc, how));
    }

    HandlerState handle_enc_delta(const HandlerState& state, int enc, int delta) override {
        return HandlerState(on_enc_delta(std::any_cast<const S&>(state), enc, delta));
    }

    void shutdown(const HandlerState& state) override {
        on_shutdown(std::any_cast<const S&>(state));
    }
};

} // namespace GridLink

#endif // GRIDLINK_TYPED_CLIENT_H
