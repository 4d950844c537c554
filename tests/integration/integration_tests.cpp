#include "testing/test_framework.h"
#include "application/use_cases.h"
#include "domain/vendor_registry.h"
#include "infrastructure/config_manager.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"
#include "infrastructure/openssl_hash.h"
#include "infrastructure/oui_registry.h"
#include "infrastructure/time_sources.h"
#include "presentation/cli.h"
#include "presentation/container.h"
#include "presentation/prompt.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace ulagen::testing {

using infrastructure::AcquisitionException;
using infrastructure::InternalInvariantException;
using infrastructure::ValidationException;
using infrastructure::VendorNotFoundException;
using infrastructure::SntpCodec;

namespace {

const char* GOLDEN_MAC = "00:0d:3a:00:00:01";
const char* GOLDEN_CLOCK = "dcf4268b208dd000";
const char* GOLDEN_PREFIX = "fd58:e975:6519::/48";

const char* OUI_FIXTURE =
    "00-0D-3A   (hex)\t\tMicrosoft Corp.\n"
    "000D3A     (base 16)\t\tMicrosoft Corp.\n"
    "\t\t\t\tOne Microsoft Way\n"
    "\n"
    "00-00-00   (hex)\t\tXEROX CORPORATION\n"
    "000000     (base 16)\t\tXEROX CORPORATION\n";

std::filesystem::path scratch_dir() {
    auto dir = std::filesystem::temp_directory_path() / "ulagen-integration-tests";
    std::filesystem::create_directories(dir);
    return dir;
}

std::string write_fixture(const std::string& name) {
    auto path = scratch_dir() / name;
    std::ofstream out(path);
    out << OUI_FIXTURE;
    return path.string();
}

class FakeHardwareAddressSource : public domain::IHardwareAddressSource, public MockObject {
public:
    explicit FakeHardwareAddressSource(std::string value) : value_(std::move(value)) {}

    std::string acquire_address() override {
        record_call("acquire_address");
        return value_;
    }
    std::string describe() const override { return "fake"; }

private:
    std::string value_;
};

class FakeTimeSource : public domain::ITimeSource, public MockObject {
public:
    explicit FakeTimeSource(std::string value, bool fail = false) : value_(std::move(value)), fail_(fail) {}

    std::string acquire_timestamp() override {
        record_call("acquire_timestamp");
        if (fail_) {
            throw AcquisitionException("fake clock", "unreachable");
        }
        return value_;
    }
    std::string describe() const override { return "fake"; }

private:
    std::string value_;
    bool fail_;
};

class FakeRegistrySource : public domain::IRegistrySource, public MockObject {
public:
    std::shared_ptr<const domain::VendorRegistry> load_registry() override {
        record_call("load_registry");
        auto registry = std::make_shared<domain::VendorRegistry>();
        registry->add("000D3A", "Microsoft Corp.");
        return registry;
    }
    std::string describe() const override { return "fake"; }
};

std::shared_ptr<const application::UlaGenerationService> golden_service() {
    return std::make_shared<application::UlaGenerationService>(std::make_shared<infrastructure::OpenSSLSha1>());
}

// Answers exactly one SNTP request on 127.0.0.1 with whatever respond() builds.
class LoopbackSntpServer {
public:
    using Responder = std::function<SntpCodec::Reply(const SntpCodec::Reply& request)>;

    explicit LoopbackSntpServer(Responder respond) : respond_(std::move(respond)) {
        fd_ = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd_ == -1) {
            throw std::runtime_error("loopback server: socket failed");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            close(fd_);
            throw std::runtime_error("loopback server: bind failed");
        }

        socklen_t length = sizeof(addr);
        if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &length) != 0) {
            close(fd_);
            throw std::runtime_error("loopback server: getsockname failed");
        }
        port_ = ntohs(addr.sin_port);

        timeval tv{};
        tv.tv_sec = 3;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        worker_ = std::thread([this]() { serve_one(); });
    }

    ~LoopbackSntpServer() {
        join();
        close(fd_);
    }

    uint16_t port() const { return port_; }
    bool answered() const { return answered_.load(); }

    void join() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    // Why the worker gave up without answering; read after join().
    const std::string& failure() const { return failure_; }

private:
    void serve_one() {
        std::array<uint8_t, 512> buffer{};
        sockaddr_in peer{};
        socklen_t peer_length = sizeof(peer);

        ssize_t received = recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                    reinterpret_cast<sockaddr*>(&peer), &peer_length);
        if (received < static_cast<ssize_t>(SntpCodec::PACKET_SIZE)) {
            failure_ = "no request received";
            return;
        }

        try {
            auto request = SntpCodec::parse(buffer.data(), static_cast<size_t>(received));
            auto packet = SntpCodec::build_reply(respond_(request));
            sendto(fd_, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&peer), peer_length);
            answered_ = true;
        } catch (const std::exception& e) {
            failure_ = e.what();
        }
    }

    Responder respond_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> answered_{false};
    std::string failure_;
    std::thread worker_;
};

SntpCodec::Reply server_reply(const SntpCodec::Reply& request) {
    SntpCodec::Reply reply;
    reply.version = SntpCodec::VERSION;
    reply.mode = SntpCodec::MODE_SERVER;
    reply.stratum = 2;
    reply.reference_id = 0x7f000001;
    reply.origin_timestamp = request.transmit_timestamp;
    reply.receive_timestamp = 0xdcf4268b00000000ULL;
    reply.transmit_timestamp = 0xdcf4268b208dd000ULL;
    return reply;
}

infrastructure::SntpTimeSource::Options loopback_options(uint16_t port) {
    infrastructure::SntpTimeSource::Options options;
    options.server = "127.0.0.1";
    options.port = port;
    options.timeout = std::chrono::milliseconds(2000);
    options.retry.max_attempts = 1;
    return options;
}

}

TEST_SUITE(GenerateUseCaseTests) {
    TEST_CASE(EndToEndWithFakes, "Collaborators are each asked once and the golden prefix comes out") {
        auto hardware = std::make_shared<FakeHardwareAddressSource>(GOLDEN_MAC);
        auto time = std::make_shared<FakeTimeSource>(GOLDEN_CLOCK);
        auto registry = std::make_shared<FakeRegistrySource>();

        application::GenerateUlaUseCase use_case(hardware, registry, time, golden_service());
        auto result = use_case.execute();

        ASSERT_EQ(std::string(GOLDEN_PREFIX), result.ula_prefix);
        ASSERT_EQ(std::string("Microsoft Corp."), result.vendor);
        ASSERT_EQ(size_t(1), hardware->get_call_count("acquire_address"));
        ASSERT_EQ(size_t(1), time->get_call_count("acquire_timestamp"));
        ASSERT_EQ(size_t(1), registry->get_call_count("load_registry"));
    }

    TEST_CASE(BadMacStopsBeforeClock, "A mistyped MAC is reported without acquiring a timestamp") {
        auto hardware = std::make_shared<FakeHardwareAddressSource>("00:0d:3a:00:00:0x");
        auto time = std::make_shared<FakeTimeSource>(GOLDEN_CLOCK);
        auto registry = std::make_shared<FakeRegistrySource>();

        application::GenerateUlaUseCase use_case(hardware, registry, time, golden_service());
        ASSERT_THROWS(use_case.execute(), ValidationException);
        ASSERT_FALSE(time->was_called("acquire_timestamp"));
        ASSERT_FALSE(registry->was_called("load_registry"));
    }

    TEST_CASE(BadClockStopsBeforeLookup) {
        auto hardware = std::make_shared<FakeHardwareAddressSource>(GOLDEN_MAC);
        auto time = std::make_shared<FakeTimeSource>("dcf4268b");
        auto registry = std::make_shared<FakeRegistrySource>();

        application::GenerateUlaUseCase use_case(hardware, registry, time, golden_service());
        ASSERT_THROWS(use_case.execute(), ValidationException);
        ASSERT_FALSE(registry->was_called("load_registry"));
    }

    TEST_CASE(UnknownVendor) {
        auto hardware = std::make_shared<FakeHardwareAddressSource>("01:02:03:04:05:06");
        auto time = std::make_shared<FakeTimeSource>(GOLDEN_CLOCK);
        auto registry = std::make_shared<FakeRegistrySource>();

        application::GenerateUlaUseCase use_case(hardware, registry, time, golden_service());
        ASSERT_THROWS(use_case.execute(), VendorNotFoundException);
    }

    TEST_CASE(AcquisitionFailurePropagates) {
        auto hardware = std::make_shared<FakeHardwareAddressSource>(GOLDEN_MAC);
        auto time = std::make_shared<FakeTimeSource>("", true);
        auto registry = std::make_shared<FakeRegistrySource>();

        application::GenerateUlaUseCase use_case(hardware, registry, time, golden_service());
        ASSERT_THROWS(use_case.execute(), AcquisitionException);
    }

    TEST_CASE(MissingCollaborator) {
        auto hardware = std::make_shared<FakeHardwareAddressSource>(GOLDEN_MAC);
        auto registry = std::make_shared<FakeRegistrySource>();
        ASSERT_THROWS(application::GenerateUlaUseCase(hardware, registry, nullptr, golden_service()),
                      InternalInvariantException);
    }
}

TEST_SUITE(SntpTimeSourceTests) {
    TEST_CASE(QueriesLoopbackServer, "The server's transmit timestamp becomes the clock value") {
        LoopbackSntpServer server(server_reply);
        infrastructure::SntpTimeSource source(loopback_options(server.port()));

        ASSERT_EQ(std::string("dcf4268b208dd000"), source.acquire_timestamp());
        ASSERT_TRUE(server.answered());
    }

    TEST_CASE(KissOfDeathIsAnAcquisitionError) {
        LoopbackSntpServer server([](const SntpCodec::Reply& request) {
            auto reply = server_reply(request);
            reply.stratum = 0;
            reply.reference_id = 0x44454e59;  // "DENY"
            return reply;
        });
        infrastructure::SntpTimeSource source(loopback_options(server.port()));

        try {
            source.acquire_timestamp();
        } catch (const AcquisitionException& e) {
            ASSERT_CONTAINS(std::string(e.what()), "DENY");
            return;
        }
        throw AssertionException("kiss-of-death reply accepted", __FILE__, __LINE__);
    }

    TEST_CASE(ForgedOriginIsRejected) {
        LoopbackSntpServer server([](const SntpCodec::Reply& request) {
            auto reply = server_reply(request);
            reply.origin_timestamp = request.transmit_timestamp + 1;
            return reply;
        });
        infrastructure::SntpTimeSource source(loopback_options(server.port()));
        ASSERT_THROWS(source.acquire_timestamp(), AcquisitionException);
    }

    TEST_CASE(ServerFaultBecomesTimeout, "A server that fails mid-request leaves the client with an acquisition error") {
        LoopbackSntpServer server([](const SntpCodec::Reply&) -> SntpCodec::Reply {
            throw std::runtime_error("responder out of service");
        });
        infrastructure::SntpTimeSource source(loopback_options(server.port()));

        ASSERT_THROWS(source.acquire_timestamp(), AcquisitionException);
        server.join();
        ASSERT_FALSE(server.answered());
        ASSERT_EQ(std::string("responder out of service"), server.failure());
    }

    TEST_CASE(UnresolvableServer) {
        auto options = loopback_options(123);
        options.server = "ulagen.invalid";
        infrastructure::SntpTimeSource source(options);
        ASSERT_THROWS(source.acquire_timestamp(), AcquisitionException);
    }
}

TEST_SUITE(RegistryCacheTests) {
    SETUP() {
        std::filesystem::remove_all(scratch_dir());
    }

    TEARDOWN() {
        std::filesystem::remove_all(scratch_dir());
    }

    TEST_CASE(DownloadsMissingCache, "A missing cache is fetched, then read") {
        std::string source_path = write_fixture("published-oui.txt");
        std::string cache_path = (scratch_dir() / "cache-oui.txt").string();

        infrastructure::CachingRegistrySource::Options options;
        options.cache_path = cache_path;
        options.url = "file://" + source_path;
        options.download.retry.max_attempts = 1;

        infrastructure::CachingRegistrySource source(options);
        auto registry = source.load_registry();

        ASSERT_EQ(size_t(2), registry->size());
        ASSERT_EQ(std::string("Microsoft Corp."), registry->lookup_vendor("000D3A"));
        ASSERT_TRUE(std::filesystem::exists(cache_path));
        ASSERT_FALSE(std::filesystem::exists(cache_path + ".part"));
    }

    TEST_CASE(UsesCacheWithoutNetwork) {
        std::string cache_path = write_fixture("cache-oui.txt");

        infrastructure::CachingRegistrySource::Options options;
        options.cache_path = cache_path;
        options.url = "file:///nonexistent/ulagen/oui.txt";
        options.auto_download = false;

        infrastructure::CachingRegistrySource source(options);
        ASSERT_EQ(size_t(2), source.load_registry()->size());
    }

    TEST_CASE(MissingCacheWithDownloadDisabled) {
        infrastructure::CachingRegistrySource::Options options;
        options.cache_path = (scratch_dir() / "absent.txt").string();
        options.auto_download = false;

        infrastructure::CachingRegistrySource source(options);
        try {
            source.load_registry();
        } catch (const AcquisitionException& e) {
            ASSERT_CONTAINS(std::string(e.what()), "downloading is disabled");
            return;
        }
        throw AssertionException("missing cache accepted", __FILE__, __LINE__);
    }

    TEST_CASE(FailedDownloadLeavesNoFiles) {
        std::string cache_path = (scratch_dir() / "cache-oui.txt").string();

        infrastructure::HttpRegistryDownloader::Options download;
        download.retry.max_attempts = 1;
        infrastructure::HttpRegistryDownloader downloader(download);

        ASSERT_THROWS(downloader.download("file:///nonexistent/ulagen/oui.txt", cache_path), AcquisitionException);
        ASSERT_FALSE(std::filesystem::exists(cache_path));
        ASSERT_FALSE(std::filesystem::exists(cache_path + ".part"));
    }

    TEST_CASE(ForcedRefreshReplacesCache) {
        std::string source_path = write_fixture("published-oui.txt");
        std::string cache_path = (scratch_dir() / "cache-oui.txt").string();
        {
            std::ofstream stale(cache_path);
            stale << "AA-BB-CC   (hex)\t\tStale Vendor\n";
        }

        infrastructure::CachingRegistrySource::Options options;
        options.cache_path = cache_path;
        options.url = "file://" + source_path;
        options.force_refresh = true;
        options.download.retry.max_attempts = 1;

        auto registry = infrastructure::CachingRegistrySource(options).load_registry();
        ASSERT_FALSE(registry->find("AABBCC").has_value());
        ASSERT_TRUE(registry->find("000D3A").has_value());
    }
}

TEST_SUITE(PromptTests) {
    TEST_CASE(AsksForMac) {
        std::istringstream in("  00:0d:3a:00:00:01 \n");
        std::ostringstream out;
        presentation::PromptHardwareAddressSource source(in, out);

        ASSERT_EQ(std::string(GOLDEN_MAC), source.acquire_address());
        ASSERT_CONTAINS(out.str(), "MAC address: ");
    }

    TEST_CASE(EmptyClockUsesFallback, "An empty clock answer defers to the network or local source") {
        std::istringstream in("\n");
        std::ostringstream out;
        auto fallback = std::make_shared<FakeTimeSource>(GOLDEN_CLOCK);
        presentation::PromptTimeSource source(in, out, fallback);

        ASSERT_EQ(std::string(GOLDEN_CLOCK), source.acquire_timestamp());
        ASSERT_TRUE(fallback->was_called("acquire_timestamp"));
        ASSERT_CONTAINS(out.str(), "Clock: ");
    }

    TEST_CASE(TypedClockWins) {
        std::istringstream in("dcf4268b.208dd000\n");
        std::ostringstream out;
        auto fallback = std::make_shared<FakeTimeSource>("0000000000000000");
        presentation::PromptTimeSource source(in, out, fallback);

        ASSERT_EQ(std::string("dcf4268b.208dd000"), source.acquire_timestamp());
        ASSERT_FALSE(fallback->was_called("acquire_timestamp"));
    }

    TEST_CASE(ClosedInput) {
        std::istringstream in("");
        std::ostringstream out;
        presentation::PromptHardwareAddressSource source(in, out);
        ASSERT_THROWS(source.acquire_address(), AcquisitionException);
    }
}

TEST_SUITE(ContainerTests) {
    SETUP() {
        std::filesystem::remove_all(scratch_dir());
        presentation::DependencyContainer::instance().reset();
    }

    TEARDOWN() {
        presentation::DependencyContainer::instance().reset();
        infrastructure::ConfigManager::instance().reset();
        infrastructure::Logger::instance().set_log_level(infrastructure::Logger::LogLevel::WARNING);
        std::filesystem::remove_all(scratch_dir());
    }

    TEST_CASE(CommandLineRun, "Flags alone produce the golden prefix from a local registry") {
        std::string registry_path = write_fixture("oui.txt");
        auto options = presentation::CommandLineParser::parse(std::vector<std::string>{
            "--mac", GOLDEN_MAC, "--clock", GOLDEN_CLOCK, "--registry", registry_path, "--no-download"});

        std::istringstream in;
        std::ostringstream prompts;
        auto& container = presentation::DependencyContainer::instance();
        container.initialize(options, in, prompts);

        auto result = container.get_generate_use_case()->execute();
        ASSERT_EQ(std::string(GOLDEN_PREFIX), result.ula_prefix);
        ASSERT_TRUE(prompts.str().empty());

        std::ostringstream rendered;
        container.get_result_renderer().render(result, rendered);
        ASSERT_EQ(std::string(GOLDEN_PREFIX) + "\n", rendered.str());
    }

    TEST_CASE(InteractiveRun) {
        std::string registry_path = write_fixture("oui.txt");
        auto options = presentation::CommandLineParser::parse(std::vector<std::string>{
            "--registry", registry_path, "--no-download", "--local-clock"});

        std::istringstream in("00:0d:3a:00:00:01\ndcf4268b208dd000\n");
        std::ostringstream prompts;
        auto& container = presentation::DependencyContainer::instance();
        container.initialize(options, in, prompts);

        auto result = container.get_generate_use_case()->execute();
        ASSERT_EQ(std::string(GOLDEN_PREFIX), result.ula_prefix);
        ASSERT_CONTAINS(prompts.str(), "MAC address: ");
        ASSERT_CONTAINS(prompts.str(), "Clock: ");
    }

    TEST_CASE(ConfigFileAndJsonOutput) {
        std::string registry_path = write_fixture("oui.txt");
        auto config_path = scratch_dir() / "ulagen.yaml";
        {
            std::ofstream config(config_path);
            config << "registry:\n  cache_path: " << registry_path << "\n  auto_download: false\n"
                   << "output:\n  style: compressed\n  format: json\n";
        }

        auto options = presentation::CommandLineParser::parse(std::vector<std::string>{
            "--config", config_path.string(), "--mac", GOLDEN_MAC, "--clock", GOLDEN_CLOCK});

        std::istringstream in;
        std::ostringstream prompts;
        auto& container = presentation::DependencyContainer::instance();
        container.initialize(options, in, prompts);

        auto result = container.get_generate_use_case()->execute();
        std::ostringstream rendered;
        container.get_result_renderer().render(result, rendered);

        ASSERT_CONTAINS(rendered.str(), "\"style\":\"compressed\"");
        ASSERT_CONTAINS(rendered.str(), GOLDEN_PREFIX);
    }

    TEST_CASE(InvalidConfigurationIsRejected) {
        auto options = presentation::CommandLineParser::parse(std::vector<std::string>{
            "--mac", GOLDEN_MAC, "--style", "sideways"});

        std::istringstream in;
        std::ostringstream prompts;
        ASSERT_THROWS(presentation::DependencyContainer::instance().initialize(options, in, prompts),
                      infrastructure::ConfigurationException);
    }

    TEST_CASE(UseBeforeInitialize) {
        ASSERT_THROWS(presentation::DependencyContainer::instance().get_generate_use_case(),
                      InternalInvariantException);
    }
}

}
