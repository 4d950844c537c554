#pragma once

#include "types.h"
#include <string>

namespace ulagen::domain {

class UlaFormatter {
public:
    explicit UlaFormatter(UlaRenderStyle style = UlaRenderStyle::FIXED_WIDTH) : style_(style) {}

    // fd + global ID as three 16-bit groups followed by "::/48".
    // FIXED_WIDTH keeps four digits per group, COMPRESSED drops leading zeros.
    std::string format(const GlobalId& global_id) const;

    UlaRenderStyle style() const { return style_; }

private:
    UlaRenderStyle style_;
};

std::string format_ula(const GlobalId& global_id, UlaRenderStyle style = UlaRenderStyle::FIXED_WIDTH);

}
