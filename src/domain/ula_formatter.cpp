#include "domain/ula_formatter.h"

namespace ulagen::domain {

namespace {

std::string strip_leading_zeros(const std::string& group) {
    size_t first = group.find_first_not_of('0');
    return first == std::string::npos ? "0" : group.substr(first);
}

}

std::string UlaFormatter::format(const GlobalId& global_id) const {
    std::string prefix = std::string(ULA_PREFIX_BYTE) + global_id.hex();

    std::string text;
    for (size_t i = 0; i < prefix.size(); i += 4) {
        if (i > 0) text += ':';
        std::string group = prefix.substr(i, 4);
        text += style_ == UlaRenderStyle::COMPRESSED ? strip_leading_zeros(group) : group;
    }

    return text + "::/48";
}

std::string format_ula(const GlobalId& global_id, UlaRenderStyle style) {
    return UlaFormatter(style).format(global_id);
}

}
