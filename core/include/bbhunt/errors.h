#pragma once
#include <stdexcept>
#include <string>

namespace bbhunt {

// Container execution was requested but no container runtime responds.
class CapabilityError : public std::runtime_error {
public:
    explicit CapabilityError(const std::string& what) : std::runtime_error(what) {}
};

// The container runtime refused a launch or returned output we cannot read.
// what() carries the runtime's own diagnostic text.
class DispatchError : public std::runtime_error {
public:
    explicit DispatchError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bbhunt
