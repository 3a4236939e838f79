#pragma once

#include <stdexcept>
#include <string>

namespace docledger {

// Root of every error raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Offset index asked to append an id it already holds. Indicates a reconciler bug.
class DuplicateIdError : public Error {
public:
    explicit DuplicateIdError(const std::string& id)
        : Error("duplicate id in offset index: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class OutOfRangeError : public Error {
public:
    explicit OutOfRangeError(const std::string& what) : Error(what) {}
};

// The bulk client could not deliver the batch or answered with garbage.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what) : Error(what) {}
};

// Local log/snapshot IO failed or a maintenance write was refused.
class StorageError : public Error {
public:
    explicit StorageError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace docledger
