#include "spidevio/types.hpp"

#include <cstdio>
#include <cstring>

namespace spidevio {

size_t pack_descriptor(const TransferDescriptor& d, TransferDescriptorBytes& out) {
    uint8_t* dst = out.data();
    size_t off = 0;

    // tx_buf, rx_buf: u64 (8 + 8)
    std::memcpy(dst + off, &d.tx_buf, 8);
    off += 8;
    std::memcpy(dst + off, &d.rx_buf, 8);
    off += 8;

    // len, speed_hz: u32 (4 + 4)
    std::memcpy(dst + off, &d.len, 4);
    off += 4;
    std::memcpy(dst + off, &d.speed_hz, 4);
    off += 4;

    // delay_usecs: u16
    std::memcpy(dst + off, &d.delay_usecs, 2);
    off += 2;

    // bits_per_word, cs_change, tx_nbits, rx_nbits: u8 x 4
    dst[off++] = d.bits_per_word;
    dst[off++] = d.cs_change;
    dst[off++] = d.tx_nbits;
    dst[off++] = d.rx_nbits;

    // pad: u16
    std::memcpy(dst + off, &d.pad, 2);
    off += 2;

    return off;
}

size_t unpack_descriptor(const uint8_t* src, TransferDescriptor& out) {
    size_t off = 0;

    std::memcpy(&out.tx_buf, src + off, 8);
    off += 8;
    std::memcpy(&out.rx_buf, src + off, 8);
    off += 8;
    std::memcpy(&out.len, src + off, 4);
    off += 4;
    std::memcpy(&out.speed_hz, src + off, 4);
    off += 4;
    std::memcpy(&out.delay_usecs, src + off, 2);
    off += 2;
    out.bits_per_word = src[off++];
    out.cs_change     = src[off++];
    out.tx_nbits      = src[off++];
    out.rx_nbits      = src[off++];
    std::memcpy(&out.pad, src + off, 2);
    off += 2;

    return off;
}

std::vector<ChunkSpan> chunk_spans(size_t total, size_t chunk_size) {
    std::vector<ChunkSpan> spans;
    if (total == 0 || chunk_size == 0) return spans;

    spans.reserve((total + chunk_size - 1) / chunk_size);
    for (size_t off = 0; off < total; off += chunk_size) {
        size_t remaining = total - off;
        spans.push_back({off, remaining < chunk_size ? remaining : chunk_size});
    }
    return spans;
}

std::string spidev_path(int bus, int device) {
    char path[32];
    std::snprintf(path, sizeof(path), "/dev/spidev%d.%d", bus, device);
    return path;
}

} // namespace spidevio
