#include "hardware/spi_device.hpp"
#include "spidevio/errors.hpp"

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace spidevio {

SpiDevice::SpiDevice(int bus, int device, const SpiConfig& config)
    : SpiDevice(spidev_path(bus, device), config) {}

SpiDevice::SpiDevice(const std::string& path, const SpiConfig& config)
    : SpiDevice(FileDeviceHandle::open(path), config) {}

SpiDevice::SpiDevice(std::unique_ptr<DeviceHandle> handle, const SpiConfig& config)
    : handle_(std::move(handle))
{
    if (!handle_) {
        throw std::invalid_argument("SpiDevice: null device handle");
    }
    // handle_ closes itself on unwind if a setting is rejected
    apply_config(config);
}

SpiDevice::~SpiDevice() {
    close();
}

void SpiDevice::close() {
    if (handle_) {
        handle_->close();
    }
}

// Fixed order: scalars first, then the mode bits from CPHA upwards.
// A setting is applied iff the caller supplied it.
void SpiDevice::apply_config(const SpiConfig& config) {
    if (config.max_speed_hz)  set_max_speed_hz(*config.max_speed_hz);
    if (config.bits_per_word) set_bits_per_word(*config.bits_per_word);
    if (config.phase)         set_phase(*config.phase);
    if (config.polarity)      set_polarity(*config.polarity);
    if (config.cs_high)       set_cs_high(*config.cs_high);
    if (config.lsb_first)     set_lsb_first(*config.lsb_first);
    if (config.three_wire)    set_three_wire(*config.three_wire);
    if (config.loop)          set_loop(*config.loop);
    if (config.no_cs)         set_no_cs(*config.no_cs);
    if (config.ready)         set_ready(*config.ready);
}

// --- Raw ioctl helpers ---

void SpiDevice::read_command(const IoctlCommand& cmd, void* arg) {
    if (!is_open()) throw IoctlFailed(cmd, EBADF);
    throw_if_errno(handle_->ioctl(cmd.opcode, arg) < 0, cmd);
}

void SpiDevice::write_command(const IoctlCommand& cmd, const void* arg) {
    if (!is_open()) throw IoctlFailed(cmd, EBADF);
    // The kernel only reads through this pointer for _IOC_WRITE commands
    throw_if_errno(handle_->ioctl(cmd.opcode, const_cast<void*>(arg)) < 0, cmd);
}

// --- Mode bits ---

// Fields in the low byte go through RD/WR_MODE, the dual/quad bits above it
// through RD/WR_MODE32.
bool SpiDevice::get_mode_field(uint32_t field) {
    if (field > 0xFF) {
        return (mode32() & field) != 0;
    }
    return (mode() & field) != 0;
}

void SpiDevice::set_mode_field(uint32_t field, bool value) {
    if (field > 0xFF) {
        uint32_t m = mode32();
        set_mode32(value ? (m | field) : (m & ~field));
        return;
    }
    uint8_t m = mode();
    if (value) {
        m |= static_cast<uint8_t>(field);
    } else {
        m &= static_cast<uint8_t>(~field);
    }
    set_mode(m);
}

// --- Scalar settings ---

uint8_t SpiDevice::mode() {
    uint8_t m = 0;
    read_command(cmd::RD_MODE, &m);
    return m;
}

void SpiDevice::set_mode(uint8_t mode) {
    write_command(cmd::WR_MODE, &mode);
}

uint32_t SpiDevice::mode32() {
    uint32_t m = 0;
    read_command(cmd::RD_MODE32, &m);
    return m;
}

void SpiDevice::set_mode32(uint32_t mode) {
    write_command(cmd::WR_MODE32, &mode);
}

uint32_t SpiDevice::max_speed_hz() {
    uint32_t hz = 0;
    read_command(cmd::RD_MAX_SPEED_HZ, &hz);
    return hz;
}

void SpiDevice::set_max_speed_hz(uint32_t hz) {
    write_command(cmd::WR_MAX_SPEED_HZ, &hz);
}

uint8_t SpiDevice::bits_per_word() {
    uint8_t bits = 0;
    read_command(cmd::RD_BITS_PER_WORD, &bits);
    return bits;
}

void SpiDevice::set_bits_per_word(uint8_t bits) {
    write_command(cmd::WR_BITS_PER_WORD, &bits);
}

// --- Transfers ---

void SpiDevice::run_chunked(const uint8_t* tx, uint8_t* rx, size_t len,
                            const TransferOptions& opts) {
    if (len == 0) return;
    if (!tx && !rx) {
        throw std::invalid_argument("SpiDevice: transfer without tx or rx buffer");
    }

    for (const ChunkSpan& span : chunk_spans(len)) {
        // Descriptor lives for exactly one ioctl. Buffer addresses point straight
        // into the caller's data at this chunk's offset.
        TransferDescriptor d;
        d.tx_buf = tx ? reinterpret_cast<uintptr_t>(tx + span.offset) : 0;
        d.rx_buf = rx ? reinterpret_cast<uintptr_t>(rx + span.offset) : 0;
        d.len = static_cast<uint32_t>(span.len);
        d.speed_hz = opts.speed_hz;
        d.delay_usecs = opts.delay_usecs;
        d.bits_per_word = opts.bits_per_word;

        TransferDescriptorBytes wire;
        pack_descriptor(d, wire);
        write_command(cmd::MESSAGE_1, wire.data());
    }
}

void SpiDevice::write(const std::vector<uint8_t>& data, const TransferOptions& opts) {
    write(data.data(), data.size(), opts);
}

void SpiDevice::write(const uint8_t* data, size_t len, const TransferOptions& opts) {
    run_chunked(data, nullptr, len, opts);
}

std::vector<uint8_t> SpiDevice::read(size_t length, const TransferOptions& opts) {
    std::vector<uint8_t> rx(length);
    read(rx.data(), rx.size(), opts);
    return rx;
}

void SpiDevice::read(uint8_t* rx, size_t len, const TransferOptions& opts) {
    run_chunked(nullptr, rx, len, opts);
}

std::vector<uint8_t> SpiDevice::transfer(const std::vector<uint8_t>& data,
                                         const TransferOptions& opts) {
    std::vector<uint8_t> rx(data.size());
    transfer(data.data(), rx.data(), data.size(), opts);
    return rx;
}

void SpiDevice::transfer(const uint8_t* tx, uint8_t* rx, size_t len,
                         const TransferOptions& opts) {
    if (len > 0 && (!tx || !rx)) {
        throw std::invalid_argument("SpiDevice: full-duplex transfer needs tx and rx");
    }
    run_chunked(tx, rx, len, opts);
}

} // namespace spidevio
