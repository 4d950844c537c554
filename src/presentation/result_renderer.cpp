#include "presentation/result_renderer.h"
#include "infrastructure/error_handler.h"
#include <nlohmann/json.hpp>

namespace ulagen::presentation {

bool parse_output_format(const std::string& text, OutputFormat& format) {
    if (text == "text") {
        format = OutputFormat::TEXT;
    } else if (text == "json") {
        format = OutputFormat::JSON;
    } else {
        return false;
    }
    return true;
}

int exit_code_for(const std::exception& error) {
    auto* known = dynamic_cast<const infrastructure::UlaException*>(&error);
    if (known == nullptr) {
        return EXIT_INTERNAL_ERROR;
    }

    switch (known->get_category()) {
        case infrastructure::ErrorCategory::VALIDATION:
        case infrastructure::ErrorCategory::GROUP_ADDRESS:
        case infrastructure::ErrorCategory::VENDOR:
        case infrastructure::ErrorCategory::PLACEHOLDER:
            return EXIT_INPUT_ERROR;
        case infrastructure::ErrorCategory::ACQUISITION:
            return EXIT_ACQUISITION_ERROR;
        case infrastructure::ErrorCategory::CONFIGURATION:
            return EXIT_CONFIGURATION_ERROR;
        case infrastructure::ErrorCategory::INTERNAL:
        case infrastructure::ErrorCategory::UNKNOWN:
            return EXIT_INTERNAL_ERROR;
    }
    return EXIT_INTERNAL_ERROR;
}

std::string ResultRenderer::to_json(const domain::GenerationResult& result) const {
    nlohmann::json root;
    root["mac"] = result.mac.to_colon_string();
    root["vendor"] = result.vendor;
    root["ntp_time"] = result.timestamp.hex();
    root["eui64"] = result.eui64.hex();
    root["global_id"] = result.global_id.hex();
    root["ula_prefix"] = result.ula_prefix;
    root["style"] = domain::render_style_to_string(result.style);
    return root.dump(verbose_ ? 2 : -1);
}

void ResultRenderer::render(const domain::GenerationResult& result, std::ostream& out) const {
    if (format_ == OutputFormat::JSON) {
        out << to_json(result) << "\n";
    } else if (verbose_) {
        render_report(result, out);
    } else {
        out << result.ula_prefix << "\n";
    }
}

void ResultRenderer::render_report(const domain::GenerationResult& result, std::ostream& out) const {
    out << "\n";
    out << "## Inputs ##\n";
    out << "MAC address = " << result.mac << " (" << result.vendor << ")\n";
    out << "NTP time = " << result.timestamp << "\n";
    out << "\n";
    out << "## Intermediary values ##\n";
    out << "EUI64 address = " << result.eui64 << "\n";
    out << "\n";
    out << "## Generated ULA ##\n";
    out << result.ula_prefix << "\n";
    out << "\n";
}

void ResultRenderer::render_error(const std::exception& error, std::ostream& err) {
    auto* internal = dynamic_cast<const infrastructure::InternalInvariantException*>(&error);
    auto* known = dynamic_cast<const infrastructure::UlaException*>(&error);

    err << "\n";
    if (internal != nullptr || known == nullptr) {
        err << "== Internal error ==\n";
        err << error.what() << "\n";
        err << "This is a defect in ulagen, please report it.\n";
        return;
    }

    err << "== Error ==\n";
    err << error.what() << "\n";
}

}
