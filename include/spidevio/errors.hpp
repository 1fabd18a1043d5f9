#pragma once

#include "spidevio/ioctl.hpp"

#include <string>
#include <system_error>

namespace spidevio {

// Base of every error raised by the library. code() carries the errno value
// in std::generic_category(), so callers can tell EACCES from EINVAL.
class SpiError : public std::system_error {
public:
    SpiError(int err, const std::string& what);
};

// The device node does not exist. Raised before anything is opened.
class DeviceNotFound : public SpiError {
public:
    explicit DeviceNotFound(const std::string& path);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// open(2) on the device node failed (permissions, busy, driver error)
class OpenFailed : public SpiError {
public:
    OpenFailed(const std::string& path, int err);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// An ioctl on an open device failed
class IoctlFailed : public SpiError {
public:
    IoctlFailed(const IoctlCommand& cmd, int err);

    uint32_t opcode() const { return opcode_; }

private:
    uint32_t opcode_;
};

// Throws IoctlFailed with the current errno when `failed` is true.
void throw_if_errno(bool failed, const IoctlCommand& cmd);

} // namespace spidevio
