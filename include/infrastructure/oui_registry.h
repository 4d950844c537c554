#pragma once

#include "../domain/interfaces.h"
#include "../domain/vendor_registry.h"
#include "error_handler.h"
#include <chrono>
#include <istream>
#include <memory>
#include <string>

namespace ulagen::infrastructure {

// Reads the IEEE MA-L registry in either of its published forms:
//   oui.txt   "00-22-72   (hex)\t\tVendor" and "002272     (base 16)\t\tVendor"
//   oui.csv   "MA-L,002272,Vendor,Address"
class OuiFileParser {
public:
    enum class Format {
        TEXT,
        CSV
    };

    static domain::VendorRegistry parse(std::istream& input);
    static domain::VendorRegistry parse_string(const std::string& content);
    static domain::VendorRegistry parse_file(const std::string& path);

    static Format detect_format(const std::string& first_line);

private:
    static bool parse_text_line(const std::string& line, std::string& oui, std::string& vendor);
    static bool parse_csv_line(const std::string& line, std::string& oui, std::string& vendor);
    static std::vector<std::string> split_csv(const std::string& line);
};

class FileRegistrySource : public domain::IRegistrySource {
public:
    explicit FileRegistrySource(std::string path) : path_(std::move(path)) {}

    std::shared_ptr<const domain::VendorRegistry> load_registry() override;
    std::string describe() const override { return "file " + path_; }

private:
    std::string path_;
};

class HttpRegistryDownloader {
public:
    struct Options {
        std::chrono::seconds timeout{60};
        std::string user_agent{"ulagen/1.0"};
        RetryPolicy::RetryConfig retry{};
    };

    HttpRegistryDownloader() : options_{} {}
    explicit HttpRegistryDownloader(Options options) : options_(std::move(options)) {}

    // Fetches url into destination_path atomically (temporary file + rename).
    // Returns the number of bytes written.
    size_t download(const std::string& url, const std::string& destination_path) const;

private:
    size_t download_once(const std::string& url, const std::string& destination_path) const;

    Options options_;
};

// Reads the local cache, downloading it first when it is missing or a refresh
// is requested.
class CachingRegistrySource : public domain::IRegistrySource {
public:
    struct Options {
        std::string cache_path{"oui.txt"};
        std::string url{"https://standards-oui.ieee.org/oui/oui.txt"};
        bool auto_download{true};
        bool force_refresh{false};
        HttpRegistryDownloader::Options download{};
    };

    explicit CachingRegistrySource(Options options);

    std::shared_ptr<const domain::VendorRegistry> load_registry() override;
    std::string describe() const override;

private:
    Options options_;
    HttpRegistryDownloader downloader_;
};

}
