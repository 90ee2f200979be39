#include "linalg_settings.h"

namespace Linalg {

static LINALG_STATIC_MAP<std::string_view, OutputFormat> format_names {
    {"plain", FORMAT_PLAIN},
    {"text", FORMAT_TEXT},
    {"csv", FORMAT_CSV},
    {"npy", FORMAT_NPY},
    {"latex", FORMAT_LATEX},
    {"json", FORMAT_JSON},
    {"table", FORMAT_TABLE},
};

void Settings::reset() noexcept {
    *this = Settings();
}

OutputFormat lookupFormat(std::string_view name) noexcept {
    auto lookup = format_names.find(name);
    return lookup == format_names.end() ? NUM_OUTPUT_FORMATS : lookup->second;
}

std::string_view formatName(OutputFormat format) noexcept {
    for(const auto& entry : format_names)
        if(entry.second == format) return entry.first;

    return "";
}

}
