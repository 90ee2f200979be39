#ifndef LINALG_SETTINGS_H
#define LINALG_SETTINGS_H

#include "linalg_common.h"
#include <string>
#include <string_view>

namespace Linalg {

enum OutputFormat {
    FORMAT_PLAIN,
    FORMAT_TEXT,
    FORMAT_CSV,
    FORMAT_NPY,
    FORMAT_LATEX,
    FORMAT_JSON,
    FORMAT_TABLE,

    NUM_OUTPUT_FORMATS,
};

struct Settings {
    static constexpr int DEFAULT_PRECISION = 4;
    static constexpr double DEFAULT_THRESHOLD = 1e-10;

    OutputFormat format = FORMAT_PLAIN;
    int precision = DEFAULT_PRECISION;
    double threshold = DEFAULT_THRESHOLD;
    std::string output_path;
    bool save_components = false;
    bool write_to_stdout = false;
    bool verbose = false;
    std::string log_path;

    void reset() noexcept;
};

//Returns NUM_OUTPUT_FORMATS for unrecognised names
OutputFormat lookupFormat(std::string_view name) noexcept;
std::string_view formatName(OutputFormat format) noexcept;

}

#endif // LINALG_SETTINGS_H
