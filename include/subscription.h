// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file subscription.h
 * @brief RAII cancellation token for channel and state-store listeners
 *
 * @pattern Guard that cancels the listener on destruction; release() detaches without cancelling.
 * @threading Main thread only
 * @gotchas The owner (Channel, StateStore) hands out a SubscriptionLifetime token. When the
 *          owner is destroyed first, the token expires and reset() skips the cancel call,
 *          which would otherwise touch freed memory.
 */

#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace kiosk {

/**
 * @brief Shared token that tracks whether a listener owner is still alive.
 *
 * Owners hold the shared_ptr; every Subscription they hand out keeps a weak_ptr.
 */
using SubscriptionLifetime = std::shared_ptr<bool>;

/**
 * @brief Move-only cancellation token returned by subscribe() calls
 */
class Subscription {
  public:
    Subscription() = default;

    Subscription(std::function<void()> cancel_fn, const SubscriptionLifetime& owner_alive)
        : cancel_(std::move(cancel_fn)), owner_alive_(owner_alive) {}

    ~Subscription() {
        reset();
    }

    Subscription(Subscription&& other) noexcept
        : cancel_(std::exchange(other.cancel_, nullptr)),
          owner_alive_(std::move(other.owner_alive_)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::exchange(other.cancel_, nullptr);
            owner_alive_ = std::move(other.owner_alive_);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Cancel the listener now (no-op if already cancelled or owner destroyed)
     */
    void reset() {
        if (cancel_) {
            auto cancel = std::exchange(cancel_, nullptr);
            if (!owner_alive_.expired()) {
                cancel();
            }
            owner_alive_.reset();
        }
    }

    /**
     * @brief Forget the listener without cancelling it
     *
     * The listener stays registered for the lifetime of its owner.
     */
    void release() {
        cancel_ = nullptr;
        owner_alive_.reset();
    }

    explicit operator bool() const {
        return cancel_ != nullptr && !owner_alive_.expired();
    }

  private:
    std::function<void()> cancel_;
    std::weak_ptr<bool> owner_alive_;
};

} // namespace kiosk
