#pragma once
/**
 * @file deferred.h
 * @brief Single-threaded settle-once result
 *
 * A Deferred is the handle returned by every asynchronous operation. It is
 * settled exactly once, either with a value or with a SimError, from inside
 * Orchestrator::poll() or a direct API call. Continuations registered after
 * settlement run immediately.
 *
 * Usage:
 * @code
 * orchestrator.get({"PLANE ALTITUDE"})
 *     .then([](const PropertyValues& values) { ... })
 *     .on_error([](const SimError& error) { ... });
 * @endcode
 */

#include "simlink/core/error.h"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace simlink {

template <typename T>
class Deferred {
public:
    using ValueCallback = std::function<void(const T&)>;
    using ErrorCallback = std::function<void(const SimError&)>;

    Deferred() : state_(std::make_shared<State>()) {}

    /**
     * @brief Settle with a value
     * @return false if already settled (the value is discarded)
     */
    bool resolve(T value) {
        if (is_settled()) {
            return false;
        }
        state_->value.emplace(std::move(value));
        auto callbacks = std::move(state_->value_callbacks);
        state_->value_callbacks.clear();
        state_->error_callbacks.clear();
        for (auto& callback : callbacks) {
            callback(*state_->value);
        }
        return true;
    }

    /**
     * @brief Settle with an error
     * @return false if already settled
     */
    bool reject(SimError error) {
        if (is_settled()) {
            return false;
        }
        state_->error.emplace(std::move(error));
        auto callbacks = std::move(state_->error_callbacks);
        state_->value_callbacks.clear();
        state_->error_callbacks.clear();
        for (auto& callback : callbacks) {
            callback(*state_->error);
        }
        return true;
    }

    bool is_settled() const { return state_->value.has_value() || state_->error.has_value(); }
    bool has_value() const { return state_->value.has_value(); }
    bool has_error() const { return state_->error.has_value(); }

    /**
     * @brief Access the value
     * @throws SimError if rejected, std::logic_error if still pending
     */
    const T& value() const {
        if (state_->error) {
            throw *state_->error;
        }
        if (!state_->value) {
            throw std::logic_error("Deferred value accessed before settlement");
        }
        return *state_->value;
    }

    /**
     * @brief Access the error
     * @throws std::logic_error if not rejected
     */
    const SimError& error() const {
        if (!state_->error) {
            throw std::logic_error("Deferred has no error");
        }
        return *state_->error;
    }

    Deferred& then(ValueCallback callback) {
        if (state_->value) {
            callback(*state_->value);
        } else if (!state_->error) {
            state_->value_callbacks.push_back(std::move(callback));
        }
        return *this;
    }

    Deferred& on_error(ErrorCallback callback) {
        if (state_->error) {
            callback(*state_->error);
        } else if (!state_->value) {
            state_->error_callbacks.push_back(std::move(callback));
        }
        return *this;
    }

    /// Both handles refer to the same pending operation
    bool same_as(const Deferred& other) const { return state_ == other.state_; }

private:
    struct State {
        std::optional<T> value;
        std::optional<SimError> error;
        std::vector<ValueCallback> value_callbacks;
        std::vector<ErrorCallback> error_callbacks;
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Create an already-rejected Deferred
 */
template <typename T>
Deferred<T> rejected(SimError error) {
    Deferred<T> result;
    result.reject(std::move(error));
    return result;
}

} // namespace simlink
