// DECMAIL - Error Types
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Exception classes shared by the key, transport and claim layers.

#ifndef DECMAIL_CORE_ERRORS_H
#define DECMAIL_CORE_ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

namespace decmail {

/// Caller contract violation (empty name, invalid secret, bad length)
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/// A required argument was absent
class ArgumentNullError : public InvalidArgumentError {
public:
    explicit ArgumentNullError(const std::string& argName)
        : InvalidArgumentError("Argument is null: " + argName), argName_(argName) {}
    
    const std::string& ArgName() const { return argName_; }

private:
    std::string argName_;
};

/// Well-typed input that cannot be parsed (bad prefix byte, off-curve point)
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/// No public key could be found for an address
class NoPublicKeyError : public std::runtime_error {
public:
    explicit NoPublicKeyError(const std::string& address)
        : std::runtime_error("No public key found for " + address), address_(address) {}
    
    const std::string& Address() const { return address_; }

private:
    std::string address_;
};

/// Operation is not defined for the given network or account
class NotSupportedError : public std::runtime_error {
public:
    explicit NotSupportedError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Failure reported by a single backend client
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Every configured backend failed an operation
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& msg, std::exception_ptr inner)
        : std::runtime_error(msg), inner_(std::move(inner)) {}
    
    /// Most recent backend failure
    std::exception_ptr Inner() const { return inner_; }
    
    /// Rethrow the wrapped failure (no-op when there is none)
    void RethrowInner() const {
        if (inner_) {
            std::rethrow_exception(inner_);
        }
    }

private:
    std::exception_ptr inner_;
};

/// Cooperative cancellation was observed
class OperationCanceledError : public std::runtime_error {
public:
    OperationCanceledError() : std::runtime_error("Operation was canceled") {}
};

} // namespace decmail

#endif // DECMAIL_CORE_ERRORS_H
