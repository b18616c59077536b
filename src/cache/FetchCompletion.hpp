#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include "CacheErrors.hpp"
#include "../utils/Logger.hpp"

namespace FetchCache {

// Handle a producer uses to report the outcome of one fetch.
// Copies share the same state and the first Resolve()/Reject() wins; later
// calls return false. If the last copy is destroyed before anyone settled it,
// the fetch fails with FetchAbandonedError so no waiter is left hanging.
template<typename T>
class FetchCompletion {
public:
    using Sink = std::function<void(std::optional<T> value, std::exception_ptr error)>;

    FetchCompletion() = default;
    explicit FetchCompletion(Sink sink) : state_(std::make_shared<State>(std::move(sink))) {}

    bool Resolve(T value) const {
        return state_ && state_->Settle(std::optional<T>(std::move(value)), nullptr);
    }

    bool Reject(std::exception_ptr error) const {
        if (!error) {
            error = std::make_exception_ptr(EmptyRejectionError());
        }
        return state_ && state_->Settle(std::nullopt, std::move(error));
    }

    template<typename E>
    bool Fail(E error) const {
        return Reject(std::make_exception_ptr(std::move(error)));
    }

    bool IsSettled() const {
        return state_ && state_->settled.load();
    }

private:
    struct State {
        explicit State(Sink s) : sink(std::move(s)) {}

        ~State() {
            if (settled.exchange(true)) return;
            try {
                sink(std::nullopt, std::make_exception_ptr(FetchAbandonedError()));
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, std::string("Failed to deliver abandoned fetch: ") + e.what());
            }
        }

        bool Settle(std::optional<T> value, std::exception_ptr error) {
            if (settled.exchange(true)) {
                Logger::Log(LogLevel::Debug, "Ignoring second settle of a fetch completion");
                return false;
            }
            sink(std::move(value), std::move(error));
            return true;
        }

        Sink sink;
        std::atomic<bool> settled{false};
    };

    std::shared_ptr<State> state_;
};

}
