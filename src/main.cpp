#include "hardware/loopback_test.hpp"
#include "hardware/spi_device.hpp"
#include "spidevio/errors.hpp"
#include "spidevio/hex.hpp"
#include "spidevio/ioctl.hpp"
#include "spidevio/types.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

// --- Argument parsing ---

enum class Action {
    INFO,
    WRITE,
    READ,
    TRANSFER,
    LOOPBACK_TEST,
};

struct Args {
    std::string device;         // empty = build from bus/dev
    int bus = 0;
    int dev = 0;
    spidevio::SpiConfig config;
    int spi_mode = -1;          // -1 = leave CPOL/CPHA untouched
    spidevio::TransferOptions opts;
    Action action = Action::INFO;
    std::vector<uint8_t> data;  // --write / --transfer payload
    size_t length = 0;          // --read / --loopback-test length
};

static void print_usage(const char* prog) {
    std::printf("Usage: %s [--device PATH | --bus B --dev D] [settings] [action]\n\n"
                "Settings (applied when the device is opened):\n"
                "  --speed HZ        max_speed_hz\n"
                "  --bits N          bits_per_word\n"
                "  --mode 0..3       SPI mode (CPOL/CPHA)\n"
                "  --cpha --cpol --cs-high --lsb-first --3wire --loop --no-cs --ready\n\n"
                "Per-transfer overrides:\n"
                "  --xfer-speed HZ   --xfer-bits N   --delay US\n\n"
                "Actions (default --info):\n"
                "  --info             print current device configuration\n"
                "  --write HEX        half-duplex write, e.g. --write 9f0000\n"
                "  --read N           half-duplex read of N bytes\n"
                "  --transfer HEX     full-duplex transfer, prints received bytes\n"
                "  --loopback-test N  enable loopback, send N pattern bytes, compare\n\n"
                "Default device: /dev/spidev0.0\n", prog);
}

static bool parse_uint(const char* str, unsigned long max, unsigned long& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(str, &end, 0);
    if (errno != 0 || end == str || *end != '\0' || v > max) return false;
    out = v;
    return true;
}

static void die_bad_value(const char* flag, const char* value) {
    std::fprintf(stderr, "Error: Invalid value '%s' for %s\n", value, flag);
    std::exit(1);
}

static Args parse_args(int argc, char* argv[]) {
    Args args;
    unsigned long v = 0;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(a, "--device") == 0 && has_value) {
            args.device = argv[++i];
        } else if (std::strcmp(a, "--bus") == 0 && has_value) {
            if (!parse_uint(argv[++i], 255, v)) die_bad_value(a, argv[i]);
            args.bus = static_cast<int>(v);
        } else if (std::strcmp(a, "--dev") == 0 && has_value) {
            if (!parse_uint(argv[++i], 255, v)) die_bad_value(a, argv[i]);
            args.dev = static_cast<int>(v);
        } else if (std::strcmp(a, "--speed") == 0 && has_value) {
            if (!parse_uint(argv[++i], UINT32_MAX, v)) die_bad_value(a, argv[i]);
            args.config.max_speed_hz = static_cast<uint32_t>(v);
        } else if (std::strcmp(a, "--bits") == 0 && has_value) {
            if (!parse_uint(argv[++i], 255, v)) die_bad_value(a, argv[i]);
            args.config.bits_per_word = static_cast<uint8_t>(v);
        } else if (std::strcmp(a, "--mode") == 0 && has_value) {
            if (!parse_uint(argv[++i], 3, v)) die_bad_value(a, argv[i]);
            args.spi_mode = static_cast<int>(v);
        } else if (std::strcmp(a, "--cpha") == 0) {
            args.config.phase = true;
        } else if (std::strcmp(a, "--cpol") == 0) {
            args.config.polarity = true;
        } else if (std::strcmp(a, "--cs-high") == 0) {
            args.config.cs_high = true;
        } else if (std::strcmp(a, "--lsb-first") == 0) {
            args.config.lsb_first = true;
        } else if (std::strcmp(a, "--3wire") == 0) {
            args.config.three_wire = true;
        } else if (std::strcmp(a, "--loop") == 0) {
            args.config.loop = true;
        } else if (std::strcmp(a, "--no-cs") == 0) {
            args.config.no_cs = true;
        } else if (std::strcmp(a, "--ready") == 0) {
            args.config.ready = true;
        } else if (std::strcmp(a, "--xfer-speed") == 0 && has_value) {
            if (!parse_uint(argv[++i], UINT32_MAX, v)) die_bad_value(a, argv[i]);
            args.opts.speed_hz = static_cast<uint32_t>(v);
        } else if (std::strcmp(a, "--xfer-bits") == 0 && has_value) {
            if (!parse_uint(argv[++i], 255, v)) die_bad_value(a, argv[i]);
            args.opts.bits_per_word = static_cast<uint8_t>(v);
        } else if (std::strcmp(a, "--delay") == 0 && has_value) {
            if (!parse_uint(argv[++i], UINT16_MAX, v)) die_bad_value(a, argv[i]);
            args.opts.delay_usecs = static_cast<uint16_t>(v);
        } else if (std::strcmp(a, "--info") == 0) {
            args.action = Action::INFO;
        } else if (std::strcmp(a, "--write") == 0 && has_value) {
            if (!spidevio::parse_hex(argv[++i], args.data)) die_bad_value(a, argv[i]);
            args.action = Action::WRITE;
        } else if (std::strcmp(a, "--transfer") == 0 && has_value) {
            if (!spidevio::parse_hex(argv[++i], args.data)) die_bad_value(a, argv[i]);
            args.action = Action::TRANSFER;
        } else if (std::strcmp(a, "--read") == 0 && has_value) {
            if (!parse_uint(argv[++i], 16u << 20, v)) die_bad_value(a, argv[i]);
            args.length = v;
            args.action = Action::READ;
        } else if (std::strcmp(a, "--loopback-test") == 0 && has_value) {
            if (!parse_uint(argv[++i], 16u << 20, v)) die_bad_value(a, argv[i]);
            args.length = v;
            args.action = Action::LOOPBACK_TEST;
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::fprintf(stderr, "Error: Unknown or incomplete option '%s'\n", a);
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    // --mode N overrides individual --cpha/--cpol
    if (args.spi_mode >= 0) {
        args.config.phase    = (args.spi_mode & spidevio::mode_bits::CPHA) != 0;
        args.config.polarity = (args.spi_mode & spidevio::mode_bits::CPOL) != 0;
    }

    return args;
}

// --- Output helpers ---

static void print_hex(const char* label, const std::vector<uint8_t>& bytes) {
    std::printf("%s (%zu bytes):", label, bytes.size());
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i % 16 == 0) std::printf("\n  %04zx:", i);
        std::printf(" %02X", bytes[i]);
    }
    std::printf("\n");
}

static size_t num_chunks(size_t len) {
    return spidevio::chunk_spans(len).size();
}

static void print_info(spidevio::SpiDevice& spi) {
    uint8_t mode = spi.mode();
    std::printf("  mode:          %u (CPOL=%d CPHA=%d)\n",
                mode & (spidevio::mode_bits::CPOL | spidevio::mode_bits::CPHA),
                (mode & spidevio::mode_bits::CPOL) ? 1 : 0,
                (mode & spidevio::mode_bits::CPHA) ? 1 : 0);
    std::printf("  flags:        %s%s%s%s%s%s\n",
                (mode & spidevio::mode_bits::CS_HIGH)    ? " cs-high"   : "",
                (mode & spidevio::mode_bits::LSB_FIRST)  ? " lsb-first" : "",
                (mode & spidevio::mode_bits::THREE_WIRE) ? " 3wire"     : "",
                (mode & spidevio::mode_bits::LOOP)       ? " loop"      : "",
                (mode & spidevio::mode_bits::NO_CS)      ? " no-cs"     : "",
                (mode & spidevio::mode_bits::READY)      ? " ready"     : "");
    std::printf("  max_speed_hz:  %u\n", spi.max_speed_hz());
    std::printf("  bits_per_word: %u\n", static_cast<unsigned>(spi.bits_per_word()));
}

static int report_loopback(const spidevio::LoopbackResult& r) {
    std::printf("Loopback test: %zu bytes in %zu chunk(s)\n", r.length, r.chunks);

    size_t shown = 0;
    for (size_t i = 0; i < r.length && shown < 8; ++i) {
        if (r.received[i] != r.sent[i]) {
            std::printf("  [MISMATCH] offset %zu: sent 0x%02X, got 0x%02X\n",
                        i, r.sent[i], r.received[i]);
            shown++;
        }
    }

    if (r.passed()) {
        std::printf("  %zu/%zu bytes echoed [OK]\n", r.length, r.length);
        return 0;
    }
    std::printf("  %zu/%zu bytes mismatched [FAIL]\n", r.mismatches, r.length);
    return 3;
}

// --- Main ---

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);
    std::string path = args.device.empty()
                           ? spidevio::spidev_path(args.bus, args.dev)
                           : args.device;

    try {
        spidevio::SpiDevice spi(path, args.config);
        std::printf("[spidev] Opened %s\n", path.c_str());

        int rc = 0;
        switch (args.action) {
        case Action::INFO:
            print_info(spi);
            break;
        case Action::WRITE:
            spi.write(args.data, args.opts);
            std::printf("[spidev] Wrote %zu bytes in %zu chunk(s)\n",
                        args.data.size(), num_chunks(args.data.size()));
            break;
        case Action::READ:
            print_hex("[spidev] Read", spi.read(args.length, args.opts));
            break;
        case Action::TRANSFER:
            print_hex("[spidev] Received", spi.transfer(args.data, args.opts));
            break;
        case Action::LOOPBACK_TEST:
            rc = report_loopback(spidevio::run_loopback_test(spi, args.length, args.opts));
            break;
        }

        spi.close();
        return rc;
    } catch (const spidevio::DeviceNotFound& e) {
        std::fprintf(stderr, "[spidev] %s (is the spidev overlay enabled?)\n", e.what());
        return 2;
    } catch (const spidevio::SpiError& e) {
        std::fprintf(stderr, "[spidev] %s [errno %d]\n", e.what(), e.code().value());
        return 1;
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "[spidev] %s\n", e.what());
        return 1;
    }
}
