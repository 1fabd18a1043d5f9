#pragma once

#include "spidevio/ioctl.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spidevio {

// SPI mode bits, equal to SPI_* in <linux/spi/spi.h>. The low byte is what
// SPI_IOC_RD/WR_MODE carries; the dual/quad bits are only reachable through
// the MODE32 ioctls.
namespace mode_bits {

constexpr uint32_t CPHA       = 0x01;
constexpr uint32_t CPOL       = 0x02;
constexpr uint32_t CS_HIGH    = 0x04;
constexpr uint32_t LSB_FIRST  = 0x08;
constexpr uint32_t THREE_WIRE = 0x10;
constexpr uint32_t LOOP       = 0x20;
constexpr uint32_t NO_CS      = 0x40;
constexpr uint32_t READY      = 0x80;
constexpr uint32_t TX_DUAL    = 0x100;
constexpr uint32_t TX_QUAD    = 0x200;
constexpr uint32_t RX_DUAL    = 0x400;
constexpr uint32_t RX_QUAD    = 0x800;

constexpr uint8_t MODE_0 = 0;
constexpr uint8_t MODE_1 = CPHA;
constexpr uint8_t MODE_2 = CPOL;
constexpr uint8_t MODE_3 = CPHA | CPOL;

} // namespace mode_bits

// Largest payload handed to the kernel in one SPI_IOC_MESSAGE.
// Matches the spidev driver's default bufsiz module parameter.
constexpr size_t SPI_CHUNK_SIZE = 4096;

// Userspace image of struct spi_ioc_transfer.
// Field order and widths are ABI: "QQIIHBBBBH", 32 bytes, native byte order.
struct TransferDescriptor {
    uint64_t tx_buf        = 0;   // 0 = no transmit data (MOSI driven with zeros)
    uint64_t rx_buf        = 0;   // 0 = discard received data
    uint32_t len           = 0;
    uint32_t speed_hz      = 0;   // 0 = device max_speed_hz
    uint16_t delay_usecs   = 0;
    uint8_t  bits_per_word = 0;   // 0 = device bits_per_word
    uint8_t  cs_change     = 0;
    uint8_t  tx_nbits      = 0;
    uint8_t  rx_nbits      = 0;
    uint16_t pad           = 0;
};

// Serialized descriptor, aligned for the kernel's copy_from_user of __u64 fields
struct alignas(8) TransferDescriptorBytes {
    std::array<uint8_t, SPI_TRANSFER_DESCRIPTOR_SIZE> bytes;

    uint8_t* data() { return bytes.data(); }
    const uint8_t* data() const { return bytes.data(); }
};

// Pack/unpack the fixed wire layout. Returns bytes written/read (always 32).
size_t pack_descriptor(const TransferDescriptor& d, TransferDescriptorBytes& out);
size_t unpack_descriptor(const uint8_t* src, TransferDescriptor& out);

// Per-call overrides for write/read/transfer. Zero = use the device setting.
struct TransferOptions {
    uint32_t speed_hz      = 0;
    uint8_t  bits_per_word = 0;
    uint16_t delay_usecs   = 0;   // delay after the last bit before CS is released
};

// Optional settings applied once when a device is opened.
// Unset fields leave the device's current configuration alone.
struct SpiConfig {
    std::optional<uint32_t> max_speed_hz;
    std::optional<uint8_t>  bits_per_word;
    std::optional<bool>     phase;        // CPHA
    std::optional<bool>     polarity;     // CPOL
    std::optional<bool>     cs_high;
    std::optional<bool>     lsb_first;
    std::optional<bool>     three_wire;
    std::optional<bool>     loop;
    std::optional<bool>     no_cs;
    std::optional<bool>     ready;
};

// One contiguous slice [offset, offset + len) of a transfer buffer
struct ChunkSpan {
    size_t offset;
    size_t len;
};

// Split [0, total) into SPI_CHUNK_SIZE pieces. The last piece may be short;
// total == 0 yields no pieces.
std::vector<ChunkSpan> chunk_spans(size_t total, size_t chunk_size = SPI_CHUNK_SIZE);

// "/dev/spidev{bus}.{device}"
std::string spidev_path(int bus, int device);

} // namespace spidevio
