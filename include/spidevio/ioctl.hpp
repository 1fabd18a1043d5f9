#pragma once

#include <cstdint>

namespace spidevio {

// Generic Linux ioctl command encoding (include/uapi/asm-generic/ioctl.h).
// Layout, MSB first: [dir:2][size:14][type:8][nr:8]
// NOTE: size is 13 bits on PPC, MIPS, SPARC and Alpha. Only the generic layout
// (x86, ARM, ARM64, RISC-V) is supported.
constexpr uint32_t IOC_NRBITS   = 8;
constexpr uint32_t IOC_TYPEBITS = 8;
constexpr uint32_t IOC_SIZEBITS = 14;
constexpr uint32_t IOC_DIRBITS  = 2;

constexpr uint32_t IOC_NRSHIFT   = 0;
constexpr uint32_t IOC_TYPESHIFT = IOC_NRSHIFT + IOC_NRBITS;      // 8
constexpr uint32_t IOC_SIZESHIFT = IOC_TYPESHIFT + IOC_TYPEBITS;  // 16
constexpr uint32_t IOC_DIRSHIFT  = IOC_SIZESHIFT + IOC_SIZEBITS;  // 30

constexpr uint32_t IOC_NRMASK   = (1u << IOC_NRBITS) - 1;
constexpr uint32_t IOC_TYPEMASK = (1u << IOC_TYPEBITS) - 1;
constexpr uint32_t IOC_SIZEMASK = (1u << IOC_SIZEBITS) - 1;
constexpr uint32_t IOC_DIRMASK  = (1u << IOC_DIRBITS) - 1;

// Data direction, seen from userspace
enum class IocDir : uint32_t {
    NONE  = 0,
    WRITE = 1,   // userspace -> kernel
    READ  = 2,   // kernel -> userspace
};

// spidev ioctl type byte
constexpr uint8_t SPIDEV_IOC_MAGIC = 'k';

// Equivalent of the kernel _IOC() macro
inline constexpr uint32_t ioc_encode(IocDir dir, uint8_t type, uint8_t nr, uint32_t size) {
    return ((static_cast<uint32_t>(dir) & IOC_DIRMASK) << IOC_DIRSHIFT) |
           ((size & IOC_SIZEMASK) << IOC_SIZESHIFT) |
           (static_cast<uint32_t>(type) << IOC_TYPESHIFT) |
           (static_cast<uint32_t>(nr) << IOC_NRSHIFT);
}

// Field extraction (_IOC_DIR, _IOC_TYPE, _IOC_NR, _IOC_SIZE)
inline constexpr IocDir ioc_dir(uint32_t op) {
    return static_cast<IocDir>((op >> IOC_DIRSHIFT) & IOC_DIRMASK);
}
inline constexpr uint8_t ioc_type(uint32_t op) {
    return static_cast<uint8_t>((op >> IOC_TYPESHIFT) & IOC_TYPEMASK);
}
inline constexpr uint8_t ioc_nr(uint32_t op) {
    return static_cast<uint8_t>((op >> IOC_NRSHIFT) & IOC_NRMASK);
}
inline constexpr uint32_t ioc_size(uint32_t op) {
    return (op >> IOC_SIZESHIFT) & IOC_SIZEMASK;
}

// A precomputed spidev ioctl: direction + opcode + argument size.
struct IoctlCommand {
    IocDir      dir;
    uint32_t    opcode;
    uint32_t    payload_size;
    const char* name;     // for error messages
};

inline constexpr IoctlCommand make_command(IocDir dir, uint8_t nr, uint32_t payload_size,
                                           const char* name) {
    return IoctlCommand{dir, ioc_encode(dir, SPIDEV_IOC_MAGIC, nr, payload_size),
                        payload_size, name};
}

// sizeof(struct spi_ioc_transfer), "QQIIHBBBBH"
constexpr uint32_t SPI_TRANSFER_DESCRIPTOR_SIZE = 32;

// SPI_MSGSIZE(n): payload of SPI_IOC_MESSAGE(n), 0 if it would not fit in 14 bits
inline constexpr uint32_t spi_msgsize(uint32_t n) {
    return (n * SPI_TRANSFER_DESCRIPTOR_SIZE < (1u << IOC_SIZEBITS))
               ? n * SPI_TRANSFER_DESCRIPTOR_SIZE
               : 0;
}

// SPI_IOC_MESSAGE(n)
inline constexpr IoctlCommand message_command(uint32_t n) {
    return make_command(IocDir::WRITE, 0, spi_msgsize(n), "SPI_IOC_MESSAGE");
}

// spidev command table, equal to the SPI_IOC_* macros of <linux/spi/spidev.h>.
// Built at compile time; the transfer engine reuses MESSAGE_1 for every chunk.
namespace cmd {

constexpr IoctlCommand MESSAGE_1 = message_command(1);

constexpr IoctlCommand RD_MODE = make_command(IocDir::READ,  1, 1, "SPI_IOC_RD_MODE");
constexpr IoctlCommand WR_MODE = make_command(IocDir::WRITE, 1, 1, "SPI_IOC_WR_MODE");

constexpr IoctlCommand RD_LSB_FIRST = make_command(IocDir::READ,  2, 1, "SPI_IOC_RD_LSB_FIRST");
constexpr IoctlCommand WR_LSB_FIRST = make_command(IocDir::WRITE, 2, 1, "SPI_IOC_WR_LSB_FIRST");

constexpr IoctlCommand RD_BITS_PER_WORD = make_command(IocDir::READ,  3, 1, "SPI_IOC_RD_BITS_PER_WORD");
constexpr IoctlCommand WR_BITS_PER_WORD = make_command(IocDir::WRITE, 3, 1, "SPI_IOC_WR_BITS_PER_WORD");

constexpr IoctlCommand RD_MAX_SPEED_HZ = make_command(IocDir::READ,  4, 4, "SPI_IOC_RD_MAX_SPEED_HZ");
constexpr IoctlCommand WR_MAX_SPEED_HZ = make_command(IocDir::WRITE, 4, 4, "SPI_IOC_WR_MAX_SPEED_HZ");

constexpr IoctlCommand RD_MODE32 = make_command(IocDir::READ,  5, 4, "SPI_IOC_RD_MODE32");
constexpr IoctlCommand WR_MODE32 = make_command(IocDir::WRITE, 5, 4, "SPI_IOC_WR_MODE32");

// Sanity checks against the kernel's published values
static_assert(RD_MODE.opcode == 0x80016B01u, "SPI_IOC_RD_MODE");
static_assert(WR_MODE.opcode == 0x40016B01u, "SPI_IOC_WR_MODE");
static_assert(RD_MAX_SPEED_HZ.opcode == 0x80046B04u, "SPI_IOC_RD_MAX_SPEED_HZ");
static_assert(MESSAGE_1.opcode == 0x40206B00u, "SPI_IOC_MESSAGE(1)");

} // namespace cmd

} // namespace spidevio
