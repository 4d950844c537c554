#include "infrastructure/oui_registry.h"
#include "infrastructure/logger.h"
#include <curl/curl.h>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <regex>
#include <sstream>

namespace ulagen::infrastructure {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\"";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

struct curl_easy_deleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

size_t on_write(void* ptr, size_t size, size_t nmemb, void* user_data) {
    auto* out = static_cast<std::ofstream*>(user_data);
    out->write(static_cast<const char*>(ptr), static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

}

OuiFileParser::Format OuiFileParser::detect_format(const std::string& first_line) {
    std::string line = trim(first_line);
    if (line.rfind("Registry,", 0) == 0 || line.rfind("MA-L,", 0) == 0) {
        return Format::CSV;
    }
    return Format::TEXT;
}

bool OuiFileParser::parse_text_line(const std::string& line, std::string& oui, std::string& vendor) {
    static const std::regex hex_pattern(
        R"(^\s*([0-9A-Fa-f]{2})-([0-9A-Fa-f]{2})-([0-9A-Fa-f]{2})\s+\(hex\)\s*(.*)$)");
    static const std::regex base16_pattern(
        R"(^\s*([0-9A-Fa-f]{6})\s+\(base 16\)\s*(.*)$)");

    std::smatch match;
    if (std::regex_match(line, match, hex_pattern)) {
        oui = match[1].str() + match[2].str() + match[3].str();
        vendor = trim(match[4].str());
        return !vendor.empty();
    }
    if (std::regex_match(line, match, base16_pattern)) {
        oui = match[1].str();
        vendor = trim(match[2].str());
        return !vendor.empty();
    }
    return false;
}

std::vector<std::string> OuiFileParser::split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

bool OuiFileParser::parse_csv_line(const std::string& line, std::string& oui, std::string& vendor) {
    auto fields = split_csv(line);
    if (fields.size() < 3) {
        return false;
    }
    oui = trim(fields[1]);
    vendor = trim(fields[2]);
    return oui.size() == domain::OUI_HEX_LENGTH && !vendor.empty();
}

domain::VendorRegistry OuiFileParser::parse(std::istream& input) {
    domain::VendorRegistry registry;
    std::string line;
    std::optional<Format> format;
    size_t line_number = 0;
    size_t rejected = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) continue;

        if (!format) {
            format = detect_format(line);
            if (*format == Format::CSV && line.rfind("Registry,", 0) == 0) {
                continue;
            }
        }

        std::string oui;
        std::string vendor;
        bool parsed = *format == Format::CSV ? parse_csv_line(line, oui, vendor)
                                             : parse_text_line(line, oui, vendor);
        if (!parsed) continue;

        // oui.txt lists every assignment twice, (hex) and (base 16)
        if (!registry.add(oui, vendor) && !registry.find(oui)) {
            ++rejected;
        }
    }

    LOG_DEBUG("oui_registry", "registry parsed",
              {{"entries", std::to_string(registry.size())},
               {"lines", std::to_string(line_number)},
               {"rejected", std::to_string(rejected)},
               {"format", format && *format == Format::CSV ? "csv" : "text"}});
    return registry;
}

domain::VendorRegistry OuiFileParser::parse_string(const std::string& content) {
    std::istringstream stream(content);
    return parse(stream);
}

domain::VendorRegistry OuiFileParser::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_ACQUISITION_ERROR("vendor registry", "cannot read \"" + path + "\"");
    }
    return parse(file);
}

std::shared_ptr<const domain::VendorRegistry> FileRegistrySource::load_registry() {
    auto registry = std::make_shared<domain::VendorRegistry>(OuiFileParser::parse_file(path_));
    if (registry->empty()) {
        THROW_ACQUISITION_ERROR("vendor registry", "\"" + path_ + "\" contains no OUI assignments");
    }

    LOG_INFO("oui_registry", "registry loaded", {{"file", path_}, {"entries", std::to_string(registry->size())}});
    return registry;
}

size_t HttpRegistryDownloader::download(const std::string& url, const std::string& destination_path) const {
    RetryPolicy retry(options_.retry);
    retry.on_retry([&url](size_t attempt, const std::exception& error) {
        LOG_WARNING("oui_download", "download failed, retrying",
                    {{"url", url}, {"attempt", std::to_string(attempt)}, {"error", error.what()}});
    });

    return retry.execute([&]() { return download_once(url, destination_path); });
}

size_t HttpRegistryDownloader::download_once(const std::string& url, const std::string& destination_path) const {
    ensure_curl_initialized();

    std::unique_ptr<CURL, curl_easy_deleter> easy(curl_easy_init());
    if (!easy) {
        THROW_ACQUISITION_ERROR("vendor registry download", "failed to create curl handle");
    }

    std::string temporary_path = destination_path + ".part";
    std::ofstream out(temporary_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        THROW_ACQUISITION_ERROR("vendor registry download", "cannot write \"" + temporary_path + "\"");
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(easy.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, on_write);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(easy.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(easy.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());

    LOG_INFO("oui_download", "downloading vendor registry", {{"url", url}, {"destination", destination_path}});

    CURLcode code = curl_easy_perform(easy.get());
    out.close();

    if (code != CURLE_OK) {
        std::remove(temporary_path.c_str());
        std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
        THROW_ACQUISITION_ERROR("vendor registry download", url + ": " + reason);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(temporary_path, ec);
    if (ec || size == 0) {
        std::remove(temporary_path.c_str());
        THROW_ACQUISITION_ERROR("vendor registry download", url + ": empty response");
    }

    std::filesystem::rename(temporary_path, destination_path, ec);
    if (ec) {
        std::remove(temporary_path.c_str());
        THROW_ACQUISITION_ERROR("vendor registry download",
                                "cannot move download into \"" + destination_path + "\": " + ec.message());
    }

    LOG_INFO("oui_download", "vendor registry downloaded", {{"bytes", std::to_string(size)}});
    return static_cast<size_t>(size);
}

CachingRegistrySource::CachingRegistrySource(Options options)
    : options_(std::move(options)), downloader_(options_.download) {}

std::string CachingRegistrySource::describe() const {
    return "cache " + options_.cache_path + (options_.auto_download ? " (source " + options_.url + ")" : "");
}

std::shared_ptr<const domain::VendorRegistry> CachingRegistrySource::load_registry() {
    std::error_code ec;
    bool cached = std::filesystem::exists(options_.cache_path, ec) && !ec;

    if (options_.force_refresh || !cached) {
        if (!options_.auto_download) {
            THROW_ACQUISITION_ERROR("vendor registry",
                                    "\"" + options_.cache_path + "\" is missing and downloading is disabled");
        }
        downloader_.download(options_.url, options_.cache_path);
    } else {
        LOG_DEBUG("oui_registry", "using cached registry", {{"file", options_.cache_path}});
    }

    return FileRegistrySource(options_.cache_path).load_registry();
}

}
