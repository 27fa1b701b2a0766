// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef KIOSK_ERROR_H
#define KIOSK_ERROR_H

#include <functional>
#include <stdexcept>
#include <string>

namespace kiosk {

/**
 * @brief Error categories reported by asynchronous kiosk operations
 */
enum class KioskErrorType {
    NONE,             // No error
    NOT_FOUND,        // Unknown page/view/item id
    ANIMATION_FAILED, // Visual element threw during the transition protocol
    SUPERSEDED,       // Request was coalesced away before it was dispatched
    VALIDATION,       // Registration/config validation failure
    CONTRACT          // Queued item had no channel or no listener to receive it
};

/**
 * @brief Error information delivered to transition error callbacks
 */
struct KioskError {
    KioskErrorType type = KioskErrorType::NONE;
    std::string message; // Human-readable error message
    std::string target;  // Page/view/item the operation addressed

    bool has_error() const { return type != KioskErrorType::NONE; }

    std::string get_type_string() const {
        switch (type) {
            case KioskErrorType::NONE: return "NONE";
            case KioskErrorType::NOT_FOUND: return "NOT_FOUND";
            case KioskErrorType::ANIMATION_FAILED: return "ANIMATION_FAILED";
            case KioskErrorType::SUPERSEDED: return "SUPERSEDED";
            case KioskErrorType::CONTRACT: return "CONTRACT";
            default: return "UNKNOWN";
        }
    }

    static KioskError not_found(const std::string& kind, const std::string& id) {
        KioskError err;
        err.type = KioskErrorType::NOT_FOUND;
        err.target = id;
        err.message = kind + " with id \"" + id + "\" not found";
        return err;
    }

    static KioskError animation_failed(const std::string& id, const std::string& what) {
        KioskError err;
        err.type = KioskErrorType::ANIMATION_FAILED;
        err.target = id;
        err.message = "Transition to \"" + id + "\" failed: " + what;
        return err;
    }

    static KioskError contract(const std::string& channel_name, const std::string& event_name,
                               const std::string& problem) {
        KioskError err;
        err.type = KioskErrorType::CONTRACT;
        err.target = channel_name + ":" + event_name;
        err.message = "Dispatch of '" + event_name + "' on channel '" + channel_name + "' abandoned: " +
                      problem;
        return err;
    }

    static KioskError superseded(const std::string& id) {
        KioskError err;
        err.type = KioskErrorType::SUPERSEDED;
        err.target = id;
        err.message = "Request for \"" + id + "\" superseded by a newer request";
        return err;
    }
};

using CompletionCallback = std::function<void()>;
using ErrorCallback = std::function<void(const KioskError&)>;

/**
 * @brief Base for exceptions thrown by synchronous kiosk operations
 */
class KioskException : public std::runtime_error {
  public:
    KioskException(KioskErrorType type, const std::string& what)
        : std::runtime_error(what), type_(type) {}

    KioskErrorType type() const { return type_; }

  private:
    KioskErrorType type_;
};

/// Registration/config validation failure. Fatal to setup, never retried.
class ValidationError : public KioskException {
  public:
    explicit ValidationError(const std::string& what)
        : KioskException(KioskErrorType::VALIDATION, what) {}
};

/// Lookup of an id that was never issued or registered.
class NotFoundError : public KioskException {
  public:
    explicit NotFoundError(const std::string& what)
        : KioskException(KioskErrorType::NOT_FOUND, what) {}
};

} // namespace kiosk

#endif // KIOSK_ERROR_H
