// fake_spidev.hpp - In-memory spidev character device for unit tests
//
// Decodes each ioctl request back into (dir, type, nr, size) and behaves like
// drivers/spi/spidev.c for the commands SpiDevice issues:
//   - nr 1..5 read/write the mode byte, LSB-first, bits/word, speed, mode32
//   - nr 0 (SPI_IOC_MESSAGE) walks the descriptor array; with mode_bits::LOOP set, rx
//     receives tx, otherwise rx is filled with miso_fill
//   - a message whose total length exceeds bufsiz fails with EMSGSIZE
// Every request is logged so tests can count syscalls and inspect descriptors.

#pragma once

#include "hardware/device_handle.hpp"
#include "spidevio/ioctl.hpp"
#include "spidevio/types.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <utility>
#include <vector>

namespace spidevio {
namespace fake {

class FakeSpidev : public DeviceHandle {
public:
    struct Message {
        TransferDescriptor desc;
        std::vector<uint8_t> tx;    // bytes the kernel would have clocked out
    };

    // --- Device state ---
    uint32_t mode = 0;              // low byte is what RD/WR_MODE sees
    uint8_t  bits_per_word = 8;
    uint32_t max_speed_hz = 500000;
    uint8_t  miso_fill = 0xFF;      // idle MISO line
    size_t   bufsiz = SPI_CHUNK_SIZE;

    // --- Observations ---
    std::vector<uint32_t> requests;
    std::vector<Message>  messages;
    int close_calls = 0;

    // --- Fault injection ---
    std::map<uint32_t, int> fail_opcode;   // opcode -> errno, fails every time
    int fail_message_at = -1;              // 0-based index of the failing MESSAGE
    int fail_message_errno = EIO;

    int ioctl(uint32_t request, void* arg) override {
        requests.push_back(request);

        if (!open_) {
            errno = EBADF;
            return -1;
        }
        if (ioc_type(request) != SPIDEV_IOC_MAGIC) {
            errno = ENOTTY;
            return -1;
        }
        auto it = fail_opcode.find(request);
        if (it != fail_opcode.end()) {
            errno = it->second;
            return -1;
        }

        const IocDir dir = ioc_dir(request);
        const uint32_t size = ioc_size(request);

        switch (ioc_nr(request)) {
        case 0:
            return message(dir, size, static_cast<const uint8_t*>(arg));
        case 1:
            return scalar8(dir, size, arg, [this](uint8_t* v, bool wr) {
                if (wr) mode = (mode & ~0xFFu) | *v; else *v = static_cast<uint8_t>(mode);
            });
        case 2:
            return scalar8(dir, size, arg, [this](uint8_t* v, bool wr) {
                if (wr) {
                    mode = *v ? (mode | mode_bits::LSB_FIRST) : (mode & ~mode_bits::LSB_FIRST);
                } else {
                    *v = static_cast<uint8_t>(mode & mode_bits::LSB_FIRST);
                }
            });
        case 3:
            return scalar8(dir, size, arg, [this](uint8_t* v, bool wr) {
                if (wr) bits_per_word = *v; else *v = bits_per_word;
            });
        case 4:
            return scalar32(dir, size, arg, max_speed_hz);
        case 5:
            return scalar32(dir, size, arg, mode);
        default:
            errno = ENOTTY;
            return -1;
        }
    }

    void close() override {
        close_calls++;
        open_ = false;
    }

    bool is_open() const override { return open_; }

    size_t count(const IoctlCommand& cmd) const {
        size_t n = 0;
        for (uint32_t r : requests) {
            if (r == cmd.opcode) n++;
        }
        return n;
    }

    // Concatenation of all transmitted bytes, in message order
    std::vector<uint8_t> transmitted() const {
        std::vector<uint8_t> out;
        for (const auto& m : messages) out.insert(out.end(), m.tx.begin(), m.tx.end());
        return out;
    }

private:
    template <typename Fn>
    int scalar8(IocDir dir, uint32_t size, void* arg, Fn fn) {
        if (size != 1 || dir == IocDir::NONE) {
            errno = EINVAL;
            return -1;
        }
        fn(static_cast<uint8_t*>(arg), dir == IocDir::WRITE);
        return 0;
    }

    int scalar32(IocDir dir, uint32_t size, void* arg, uint32_t& field) {
        if (size != 4 || dir == IocDir::NONE) {
            errno = EINVAL;
            return -1;
        }
        if (dir == IocDir::WRITE) {
            std::memcpy(&field, arg, 4);
        } else {
            std::memcpy(arg, &field, 4);
        }
        return 0;
    }

    int message(IocDir dir, uint32_t size, const uint8_t* arg) {
        if (dir != IocDir::WRITE || size == 0 || size % SPI_TRANSFER_DESCRIPTOR_SIZE != 0) {
            errno = EINVAL;
            return -1;
        }

        const int index = message_calls_++;
        if (index == fail_message_at) {
            errno = fail_message_errno;
            return -1;
        }

        const size_t n = size / SPI_TRANSFER_DESCRIPTOR_SIZE;
        std::vector<TransferDescriptor> descs(n);
        size_t total = 0;
        for (size_t i = 0; i < n; ++i) {
            unpack_descriptor(arg + i * SPI_TRANSFER_DESCRIPTOR_SIZE, descs[i]);
            total += descs[i].len;
        }
        if (total > bufsiz) {
            errno = EMSGSIZE;
            return -1;
        }

        for (const auto& d : descs) {
            Message m;
            m.desc = d;
            const auto* tx = reinterpret_cast<const uint8_t*>(static_cast<uintptr_t>(d.tx_buf));
            auto* rx = reinterpret_cast<uint8_t*>(static_cast<uintptr_t>(d.rx_buf));
            if (tx) {
                m.tx.assign(tx, tx + d.len);
            } else {
                m.tx.assign(d.len, 0x00);
            }
            if (rx) {
                if (mode & mode_bits::LOOP) {
                    std::memcpy(rx, m.tx.data(), d.len);
                } else {
                    std::memset(rx, miso_fill, d.len);
                }
            }
            messages.push_back(std::move(m));
        }
        return static_cast<int>(total);
    }

    bool open_ = true;
    int message_calls_ = 0;
};

} // namespace fake
} // namespace spidevio
