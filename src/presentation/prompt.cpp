#include "presentation/prompt.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"

namespace ulagen::presentation {

using infrastructure::AcquisitionException;

namespace {

std::string read_answer(std::istream& in, std::ostream& out, const std::string& question) {
    out << question << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        THROW_ACQUISITION_ERROR("prompt", "no answer to \"" + question + "\"");
    }

    auto start = line.find_first_not_of(" \t");
    auto end = line.find_last_not_of(" \t\r");
    return start == std::string::npos ? "" : line.substr(start, end - start + 1);
}

}

std::string PromptHardwareAddressSource::acquire_address() {
    return read_answer(in_, out_, "MAC address: ");
}

std::string PromptTimeSource::describe() const {
    return fallback_ ? "prompt (fallback " + fallback_->describe() + ")" : "prompt";
}

std::string PromptTimeSource::acquire_timestamp() {
    out_ << "For a deterministic calculation, you may enter the ntp clock time.\n";
    out_ << "Leave empty to query an NTP server.\n";

    std::string answer = read_answer(in_, out_, "Clock: ");
    if (!answer.empty()) {
        return answer;
    }

    if (!fallback_) {
        THROW_ACQUISITION_ERROR("prompt", "no clock entered");
    }
    LOG_INFO("prompt", "no clock entered, using fallback", {{"source", fallback_->describe()}});
    return fallback_->acquire_timestamp();
}

}
