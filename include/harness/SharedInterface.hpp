#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>

namespace payload_hal {
namespace harness {

/**
 * @brief Shared ownership of an interface plus exclusive access to it
 *
 * Copies share both the interface and the lock, so a copy can be handed
 * to a worker thread. lock() blocks until no other guard is alive.
 */
template<typename T>
class SharedInterface {
public:
    class Guard {
    public:
        T* operator->() const { return interface_.get(); }
        T& operator*() const { return *interface_; }

    private:
        friend class SharedInterface;

        Guard(std::mutex& mutex, std::shared_ptr<T> interface)
            : lock_(mutex)
            , interface_(std::move(interface)) {
        }

        std::unique_lock<std::mutex> lock_;
        std::shared_ptr<T> interface_;
    };

    explicit SharedInterface(std::shared_ptr<T> interface)
        : state_(std::make_shared<State>(std::move(interface))) {
        if (!state_->interface) {
            throw std::invalid_argument("SharedInterface requires an interface");
        }
    }

    Guard lock() const {
        return Guard(state_->mutex, state_->interface);
    }

    /**
     * @brief Unlocked handle, for callers that synchronize on their own
     */
    std::shared_ptr<T> get() const { return state_->interface; }

private:
    struct State {
        explicit State(std::shared_ptr<T> iface) : interface(std::move(iface)) {}

        std::mutex mutex;
        std::shared_ptr<T> interface;
    };

    std::shared_ptr<State> state_;
};

} // namespace harness
} // namespace payload_hal
