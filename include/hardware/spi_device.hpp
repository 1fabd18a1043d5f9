#pragma once

#include "hardware/device_handle.hpp"
#include "spidevio/ioctl.hpp"
#include "spidevio/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spidevio {

// Linux spidev controller: mode/speed configuration and chunked transfers,
// issued as raw ioctls without <linux/spi/spidev.h>.
//
// Every call is a blocking syscall on the caller's thread. There is no internal
// locking: a multi-chunk transfer is a sequence of ioctls, so threads sharing one
// SpiDevice must serialize around it or their chunks will interleave on the bus.
//
// All failures throw (see spidevio/errors.hpp).
class SpiDevice {
public:
    // Open /dev/spidevB.D and apply any supplied settings
    SpiDevice(int bus, int device, const SpiConfig& config = {});

    // Open an explicit device path and apply any supplied settings
    explicit SpiDevice(const std::string& path, const SpiConfig& config = {});

    // Take ownership of an already-open handle
    explicit SpiDevice(std::unique_ptr<DeviceHandle> handle, const SpiConfig& config = {});

    ~SpiDevice();

    SpiDevice(const SpiDevice&) = delete;
    SpiDevice& operator=(const SpiDevice&) = delete;

    // Release the device. Safe to call more than once.
    void close();
    bool is_open() const { return handle_ && handle_->is_open(); }

    // --- Mode bits (read-modify-write on SPI_IOC_*_MODE) ---
    // get: one ioctl. set: two ioctls (read, then write).
    // Dual/quad bits (above 0xFF) use the MODE32 ioctls instead.
    bool get_mode_field(uint32_t field);
    void set_mode_field(uint32_t field, bool value);

    // Clock phase. false: sample on leading edge, true: sample on trailing edge
    bool phase() { return get_mode_field(mode_bits::CPHA); }
    void set_phase(bool v) { set_mode_field(mode_bits::CPHA, v); }

    // Clock polarity. true: clock idles high
    bool polarity() { return get_mode_field(mode_bits::CPOL); }
    void set_polarity(bool v) { set_mode_field(mode_bits::CPOL, v); }

    // Chip select active high
    bool cs_high() { return get_mode_field(mode_bits::CS_HIGH); }
    void set_cs_high(bool v) { set_mode_field(mode_bits::CS_HIGH, v); }

    // Least significant bit first
    bool lsb_first() { return get_mode_field(mode_bits::LSB_FIRST); }
    void set_lsb_first(bool v) { set_mode_field(mode_bits::LSB_FIRST, v); }

    // Shared SI/SO line (3-wire)
    bool three_wire() { return get_mode_field(mode_bits::THREE_WIRE); }
    void set_three_wire(bool v) { set_mode_field(mode_bits::THREE_WIRE, v); }

    // Controller loopback (MOSI internally wired to MISO)
    bool loop() { return get_mode_field(mode_bits::LOOP); }
    void set_loop(bool v) { set_mode_field(mode_bits::LOOP, v); }

    // No chip select: single device on the bus
    bool no_cs() { return get_mode_field(mode_bits::NO_CS); }
    void set_no_cs(bool v) { set_mode_field(mode_bits::NO_CS, v); }

    // Slave pulls low to pause
    bool ready() { return get_mode_field(mode_bits::READY); }
    void set_ready(bool v) { set_mode_field(mode_bits::READY, v); }

    // --- Scalar settings (one ioctl each) ---
    uint8_t mode();
    void set_mode(uint8_t mode);

    // Extended mode word including dual/quad wire bits
    uint32_t mode32();
    void set_mode32(uint32_t mode);

    // The controller may round to the nearest achievable rate
    uint32_t max_speed_hz();
    void set_max_speed_hz(uint32_t hz);

    // 0 means 8 bits per word
    uint8_t bits_per_word();
    void set_bits_per_word(uint8_t bits);

    // --- Transfers ---
    // Buffers longer than SPI_CHUNK_SIZE are sent as consecutive SPI_IOC_MESSAGE(1)
    // calls, one per chunk, in order. CS may be released between chunks.
    // A failing chunk throws; chunks already clocked out are not undone.

    // Half-duplex write
    void write(const std::vector<uint8_t>& data, const TransferOptions& opts = {});
    void write(const uint8_t* data, size_t len, const TransferOptions& opts = {});

    // Half-duplex read of `length` bytes
    std::vector<uint8_t> read(size_t length, const TransferOptions& opts = {});
    void read(uint8_t* rx, size_t len, const TransferOptions& opts = {});

    // Full-duplex: returns one received byte per transmitted byte
    std::vector<uint8_t> transfer(const std::vector<uint8_t>& data,
                                  const TransferOptions& opts = {});
    void transfer(const uint8_t* tx, uint8_t* rx, size_t len,
                  const TransferOptions& opts = {});

private:
    void apply_config(const SpiConfig& config);

    // tx or rx may be null (half-duplex). len is chunked internally.
    void run_chunked(const uint8_t* tx, uint8_t* rx, size_t len, const TransferOptions& opts);

    void read_command(const IoctlCommand& cmd, void* arg);
    void write_command(const IoctlCommand& cmd, const void* arg);

    std::unique_ptr<DeviceHandle> handle_;
};

} // namespace spidevio
