#pragma once

#include <stdexcept>
#include <string>

namespace zipline {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Missing download directory, invalid port, empty source list.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

class NetworkBindError : public Error {
public:
    NetworkBindError(const std::string& what, std::string conflicting_app)
        : Error(what), conflicting_app_(std::move(conflicting_app)) {}

    // Empty when the owning process could not be identified.
    const std::string& conflicting_app() const { return conflicting_app_; }

private:
    std::string conflicting_app_;
};

class InterfaceError : public Error {
public:
    explicit InterfaceError(const std::string& what) : Error(what) {}
};

class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& what) : Error(what) {}
};

class IOError : public Error {
public:
    explicit IOError(const std::string& what) : Error(what) {}
};

class PeerGone : public Error {
public:
    explicit PeerGone(const std::string& what) : Error(what) {}
};

// The receiver refused the transfer; what() is the reason it gave.
class Declined : public Error {
public:
    explicit Declined(const std::string& reason) : Error(reason) {}
};

class Cancelled : public Error {
public:
    explicit Cancelled(const std::string& reason = "Cancelled") : Error(reason) {}
};

} // namespace zipline
