#include "spidevio/errors.hpp"

#include <cerrno>
#include <cstdio>

namespace spidevio {

SpiError::SpiError(int err, const std::string& what)
    : std::system_error(err, std::generic_category(), what) {}

DeviceNotFound::DeviceNotFound(const std::string& path)
    : SpiError(ENOENT, path + " does not exist"), path_(path) {}

OpenFailed::OpenFailed(const std::string& path, int err)
    : SpiError(err, "could not open " + path), path_(path) {}

static std::string describe(const IoctlCommand& cmd) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s (0x%08X) failed", cmd.name, cmd.opcode);
    return buf;
}

IoctlFailed::IoctlFailed(const IoctlCommand& cmd, int err)
    : SpiError(err, describe(cmd)), opcode_(cmd.opcode) {}

void throw_if_errno(bool failed, const IoctlCommand& cmd) {
    if (!failed) return;
    // Capture before anything else can clobber it
    int err = errno;
    throw IoctlFailed(cmd, err != 0 ? err : EIO);
}

} // namespace spidevio
