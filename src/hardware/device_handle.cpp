#include "hardware/device_handle.hpp"
#include "spidevio/errors.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spidevio {

std::unique_ptr<FileDeviceHandle> FileDeviceHandle::open(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) < 0 && errno == ENOENT) {
        throw DeviceNotFound(path);
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        throw OpenFailed(path, errno);
    }
    return std::make_unique<FileDeviceHandle>(fd);
}

FileDeviceHandle::FileDeviceHandle(int fd) : fd_(fd) {}

FileDeviceHandle::~FileDeviceHandle() {
    close();
}

int FileDeviceHandle::ioctl(uint32_t request, void* arg) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::ioctl(fd_, request, arg);
}

void FileDeviceHandle::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace spidevio
