#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace spidevio {

// Opaque handle to an open spidev character device.
// SpiDevice only needs ioctl() and close(); tests substitute a fake.
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    // Same contract as ioctl(2): returns < 0 and sets errno on failure.
    virtual int ioctl(uint32_t request, void* arg) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

// DeviceHandle over a POSIX file descriptor
class FileDeviceHandle : public DeviceHandle {
public:
    // Check the node exists (DeviceNotFound), then open O_RDWR (OpenFailed).
    static std::unique_ptr<FileDeviceHandle> open(const std::string& path);

    explicit FileDeviceHandle(int fd);
    ~FileDeviceHandle() override;

    FileDeviceHandle(const FileDeviceHandle&) = delete;
    FileDeviceHandle& operator=(const FileDeviceHandle&) = delete;

    int ioctl(uint32_t request, void* arg) override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }

    int fd() const { return fd_; }

private:
    int fd_;
};

} // namespace spidevio
