#pragma once

#include "../domain/interfaces.h"
#include "error_handler.h"
#include <array>
#include <chrono>
#include <cstdint>
#include <string>

namespace ulagen::infrastructure {

constexpr uint32_t NTP_UNIX_EPOCH_DIFF = 2208988800UL;

// Wire format of the 48-byte NTPv4 header (RFC 5905), big-endian.
class SntpCodec {
public:
    static constexpr size_t PACKET_SIZE = 48;
    static constexpr uint8_t VERSION = 4;
    static constexpr uint8_t MODE_CLIENT = 3;
    static constexpr uint8_t MODE_SERVER = 4;
    static constexpr uint8_t LEAP_UNSYNCHRONIZED = 3;

    using Packet = std::array<uint8_t, PACKET_SIZE>;

    struct Reply {
        uint8_t leap_indicator{0};
        uint8_t version{0};
        uint8_t mode{0};
        uint8_t stratum{0};
        uint32_t reference_id{0};
        uint64_t origin_timestamp{0};
        uint64_t receive_timestamp{0};
        uint64_t transmit_timestamp{0};
    };

    // Client request carrying transmit_timestamp, which the server echoes as origin.
    static Packet build_request(uint64_t transmit_timestamp);

    static Packet build_reply(const Reply& reply);

    // Throws AcquisitionException for a truncated packet.
    static Reply parse(const uint8_t* data, size_t size);

    // Throws AcquisitionException unless reply is a usable answer to a request sent with expected_origin.
    static void check_reply(const Reply& reply, uint64_t expected_origin);

    static std::string kiss_code(uint32_t reference_id);

private:
    static void write_u32(uint8_t* out, uint32_t value);
    static void write_u64(uint8_t* out, uint64_t value);
    static uint32_t read_u32(const uint8_t* in);
    static uint64_t read_u64(const uint8_t* in);
};

// 64-bit NTP era-0 timestamp for a wall-clock instant.
uint64_t to_ntp_timestamp(std::chrono::system_clock::time_point time);

std::string ntp_timestamp_to_hex(uint64_t timestamp);

class LiteralTimeSource : public domain::ITimeSource {
public:
    explicit LiteralTimeSource(std::string value) : value_(std::move(value)) {}

    std::string acquire_timestamp() override { return value_; }
    std::string describe() const override { return "command line"; }

private:
    std::string value_;
};

class SystemClockTimeSource : public domain::ITimeSource {
public:
    std::string acquire_timestamp() override;
    std::string describe() const override { return "local clock"; }
};

// Queries an NTP server once per attempt and returns its transmit timestamp.
class SntpTimeSource : public domain::ITimeSource {
public:
    struct Options {
        std::string server{"0.pool.ntp.org"};
        uint16_t port{123};
        std::chrono::milliseconds timeout{2000};
        RetryPolicy::RetryConfig retry{};
    };

    explicit SntpTimeSource(Options options) : options_(std::move(options)) {}

    std::string acquire_timestamp() override;
    std::string describe() const override;

private:
    uint64_t query_once() const;

    Options options_;
};

}
