#pragma once

#include "../domain/types.h"
#include <exception>
#include <ostream>
#include <string>

namespace ulagen::presentation {

enum class OutputFormat {
    TEXT,
    JSON
};

bool parse_output_format(const std::string& text, OutputFormat& format);

constexpr int EXIT_OK = 0;
constexpr int EXIT_INPUT_ERROR = 1;
constexpr int EXIT_ACQUISITION_ERROR = 2;
constexpr int EXIT_CONFIGURATION_ERROR = 3;
constexpr int EXIT_INTERNAL_ERROR = 70;

int exit_code_for(const std::exception& error);

class ResultRenderer {
public:
    ResultRenderer(OutputFormat format, bool verbose) : format_(format), verbose_(verbose) {}

    // TEXT prints the prefix alone, or the report sections when verbose.
    void render(const domain::GenerationResult& result, std::ostream& out) const;

    std::string to_json(const domain::GenerationResult& result) const;

    // "== Error ==" block for stderr; invariant violations read as defects.
    static void render_error(const std::exception& error, std::ostream& err);

private:
    void render_report(const domain::GenerationResult& result, std::ostream& out) const;

    OutputFormat format_;
    bool verbose_;
};

}
