#pragma once

#include "native_engine.hpp"

#include <atomic>
#include <optional>

// One loaded model instance: Active(id) until take() moves it to Released.
// Only the session's gateway worker calls take(); any thread may query.
class NativeHandle {
public:
    explicit NativeHandle(EngineHandle id) : id_(id) {}

    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;

    bool active() const { return id_.load(std::memory_order_acquire) != invalid_handle; }

    std::optional<EngineHandle> id() const {
        auto id = id_.load(std::memory_order_acquire);
        if (id == invalid_handle) return std::nullopt;
        return id;
    }

    // Returns the id and marks the handle released; nullopt if already released.
    std::optional<EngineHandle> take() {
        auto id = id_.exchange(invalid_handle, std::memory_order_acq_rel);
        if (id == invalid_handle) return std::nullopt;
        return id;
    }

private:
    std::atomic<EngineHandle> id_;
};
