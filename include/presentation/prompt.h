#pragma once

#include "../domain/interfaces.h"
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace ulagen::presentation {

class PromptHardwareAddressSource : public domain::IHardwareAddressSource {
public:
    PromptHardwareAddressSource(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::string acquire_address() override;
    std::string describe() const override { return "prompt"; }

private:
    std::istream& in_;
    std::ostream& out_;
};

// Asks for an NTP time; an empty answer defers to fallback.
class PromptTimeSource : public domain::ITimeSource {
public:
    PromptTimeSource(std::istream& in, std::ostream& out, std::shared_ptr<domain::ITimeSource> fallback)
        : in_(in), out_(out), fallback_(std::move(fallback)) {}

    std::string acquire_timestamp() override;
    std::string describe() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<domain::ITimeSource> fallback_;
};

}
