#pragma once

#include <stdexcept>
#include <string>

// Malformed execution context or bar sequence; nothing has been computed or written.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Write-boundary failure after the store's own retries; fails one symbol.
class TransientPersistenceError : public std::runtime_error {
public:
    explicit TransientPersistenceError(const std::string& msg) : std::runtime_error(msg) {}
};

// Store unreachable or similar; aborts the whole run.
class SystemicError : public std::runtime_error {
public:
    explicit SystemicError(const std::string& msg) : std::runtime_error(msg) {}
};
