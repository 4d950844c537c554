#include "infrastructure/time_sources.h"
#include "infrastructure/logger.h"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>

namespace ulagen::infrastructure {

namespace {

constexpr const char* SOURCE = "ntp";

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ != -1) {
            close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

struct addrinfo_deleter {
    void operator()(addrinfo* info) const noexcept {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

std::string errno_message() {
    return std::strerror(errno);
}

}

void SntpCodec::write_u32(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>(value >> 24);
    out[1] = static_cast<uint8_t>(value >> 16);
    out[2] = static_cast<uint8_t>(value >> 8);
    out[3] = static_cast<uint8_t>(value);
}

void SntpCodec::write_u64(uint8_t* out, uint64_t value) {
    write_u32(out, static_cast<uint32_t>(value >> 32));
    write_u32(out + 4, static_cast<uint32_t>(value));
}

uint32_t SntpCodec::read_u32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

uint64_t SntpCodec::read_u64(const uint8_t* in) {
    return (static_cast<uint64_t>(read_u32(in)) << 32) | read_u32(in + 4);
}

SntpCodec::Packet SntpCodec::build_request(uint64_t transmit_timestamp) {
    Packet packet{};
    packet[0] = static_cast<uint8_t>((VERSION << 3) | MODE_CLIENT);
    write_u64(packet.data() + 40, transmit_timestamp);
    return packet;
}

SntpCodec::Packet SntpCodec::build_reply(const Reply& reply) {
    Packet packet{};
    packet[0] = static_cast<uint8_t>(((reply.leap_indicator & 0x3) << 6) |
                                     ((reply.version & 0x7) << 3) | (reply.mode & 0x7));
    packet[1] = reply.stratum;
    write_u32(packet.data() + 12, reply.reference_id);
    write_u64(packet.data() + 24, reply.origin_timestamp);
    write_u64(packet.data() + 32, reply.receive_timestamp);
    write_u64(packet.data() + 40, reply.transmit_timestamp);
    return packet;
}

SntpCodec::Reply SntpCodec::parse(const uint8_t* data, size_t size) {
    if (size < PACKET_SIZE) {
        THROW_ACQUISITION_ERROR(SOURCE, "short reply of " + std::to_string(size) + " bytes");
    }

    Reply reply;
    reply.leap_indicator = static_cast<uint8_t>(data[0] >> 6);
    reply.version = static_cast<uint8_t>((data[0] >> 3) & 0x7);
    reply.mode = static_cast<uint8_t>(data[0] & 0x7);
    reply.stratum = data[1];
    reply.reference_id = read_u32(data + 12);
    reply.origin_timestamp = read_u64(data + 24);
    reply.receive_timestamp = read_u64(data + 32);
    reply.transmit_timestamp = read_u64(data + 40);
    return reply;
}

std::string SntpCodec::kiss_code(uint32_t reference_id) {
    std::string code;
    for (int shift = 24; shift >= 0; shift -= 8) {
        char c = static_cast<char>((reference_id >> shift) & 0xff);
        if (c >= 0x20 && c < 0x7f) {
            code.push_back(c);
        }
    }
    return code;
}

void SntpCodec::check_reply(const Reply& reply, uint64_t expected_origin) {
    if (reply.mode != MODE_SERVER) {
        THROW_ACQUISITION_ERROR(SOURCE, "unexpected mode " + std::to_string(reply.mode) + " in reply");
    }
    if (reply.stratum == 0) {
        THROW_ACQUISITION_ERROR(SOURCE, "kiss-of-death reply (" + kiss_code(reply.reference_id) + ")");
    }
    if (reply.leap_indicator == LEAP_UNSYNCHRONIZED) {
        THROW_ACQUISITION_ERROR(SOURCE, "server clock is not synchronized");
    }
    if (reply.origin_timestamp != expected_origin) {
        THROW_ACQUISITION_ERROR(SOURCE, "reply does not match the request");
    }
    if (reply.transmit_timestamp == 0) {
        THROW_ACQUISITION_ERROR(SOURCE, "reply carries no transmit timestamp");
    }
}

uint64_t to_ntp_timestamp(std::chrono::system_clock::time_point time) {
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);

    // Era 0 wraps in 2036; the low 32 bits are what NTP carries.
    uint32_t ntp_seconds = static_cast<uint32_t>(static_cast<uint64_t>(seconds.count()) + NTP_UNIX_EPOCH_DIFF);
    uint32_t fraction = static_cast<uint32_t>((static_cast<uint64_t>(nanos.count()) << 32) / 1000000000ULL);
    return (static_cast<uint64_t>(ntp_seconds) << 32) | fraction;
}

std::string ntp_timestamp_to_hex(uint64_t timestamp) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << timestamp;
    return oss.str();
}

std::string SystemClockTimeSource::acquire_timestamp() {
    auto timestamp = ntp_timestamp_to_hex(to_ntp_timestamp(std::chrono::system_clock::now()));
    LOG_INFO("time_source", "using local clock", {{"timestamp", timestamp}});
    return timestamp;
}

std::string SntpTimeSource::describe() const {
    return "ntp " + options_.server + ":" + std::to_string(options_.port);
}

std::string SntpTimeSource::acquire_timestamp() {
    RetryPolicy retry(options_.retry);
    retry.on_retry([this](size_t attempt, const std::exception& error) {
        LOG_WARNING("time_source", "ntp query failed, retrying",
                    {{"server", options_.server}, {"attempt", std::to_string(attempt)}, {"error", error.what()}});
    });

    uint64_t timestamp = retry.execute([this]() { return query_once(); });
    auto hex = ntp_timestamp_to_hex(timestamp);
    LOG_INFO("time_source", "ntp time acquired", {{"server", options_.server}, {"timestamp", hex}});
    return hex;
}

uint64_t SntpTimeSource::query_once() const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo* raw_result = nullptr;
    std::string port = std::to_string(options_.port);
    int rc = getaddrinfo(options_.server.c_str(), port.c_str(), &hints, &raw_result);
    if (rc != 0) {
        THROW_ACQUISITION_ERROR(SOURCE, "cannot resolve " + options_.server + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, addrinfo_deleter> result(raw_result);

    std::string last_error = "no usable address";
    for (addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
        SocketHandle sock(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() == -1) {
            last_error = "socket: " + errno_message();
            continue;
        }

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(options_.timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((options_.timeout.count() % 1000) * 1000);
        if (setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
            last_error = "setsockopt: " + errno_message();
            continue;
        }

        // A connected UDP socket only receives datagrams from the server.
        if (connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = "connect: " + errno_message();
            continue;
        }

        uint64_t origin = to_ntp_timestamp(std::chrono::system_clock::now());
        auto request = SntpCodec::build_request(origin);
        if (send(sock.get(), request.data(), request.size(), 0) != static_cast<ssize_t>(request.size())) {
            last_error = "send: " + errno_message();
            continue;
        }

        std::array<uint8_t, 512> buffer{};
        ssize_t received = recv(sock.get(), buffer.data(), buffer.size(), 0);
        if (received < 0) {
            last_error = (errno == EAGAIN || errno == EWOULDBLOCK) ? "no reply within " +
                         std::to_string(options_.timeout.count()) + " ms" : "recv: " + errno_message();
            continue;
        }

        auto reply = SntpCodec::parse(buffer.data(), static_cast<size_t>(received));
        SntpCodec::check_reply(reply, origin);

        LOG_DEBUG("time_source", "ntp reply",
                  {{"stratum", std::to_string(reply.stratum)},
                   {"version", std::to_string(reply.version)},
                   {"transmit", ntp_timestamp_to_hex(reply.transmit_timestamp)}});
        return reply.transmit_timestamp;
    }

    THROW_ACQUISITION_ERROR(SOURCE, options_.server + ": " + last_error);
}

}
