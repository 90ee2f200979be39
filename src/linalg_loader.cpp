#include "linalg_loader.h"

#include "linalg_logging.h"
#include "linalg_npy.h"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace Linalg {

namespace Code {

static bool isPlaceholderStem(const std::string& stem) noexcept {
    return stem.size() == 1 && stem.front() >= 'A' && stem.front() <= 'Z';
}

static bool endsWith(const std::string& str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() && std::string_view(str).substr(str.size()-suffix.size()) == suffix;
}

bool loadMatrices(const std::vector<std::string>& paths,
                  const std::optional<Numeric>& stdin_value,
                  Environment& environment,
                  ErrorStream& errors){
    for(const std::string& path : paths){
        if(std::filesystem::path(path).filename().string() == RESERVED_PIPE_FILE_NAME){
            errors.fail(RESERVED_PIPE_FILE);
            return false;
        }
    }

    if(stdin_value.has_value()) environment[std::string(PIPE_KEY)] = stdin_value.value();

    for(const std::string& path : paths){
        std::error_code ec;
        if(!std::filesystem::exists(path, ec)){
            errors.fail(FILE_NOT_FOUND, path);
            return false;
        }else if(!endsWith(path, ".npy")){
            errors.fail(NOT_NPY_FILE, path);
            return false;
        }

        const std::string stem = std::filesystem::path(path).stem().string();
        if(!isPlaceholderStem(stem)){
            errors.fail(INVALID_PLACEHOLDER_FILE, path);
            return false;
        }

        Numeric value;
        if(!loadNpyFile(path, value, errors)) return false;
        environment[stem] = std::move(value);
        logger->info("Loaded {:s} as {{{:s}}}", path, stem);
    }

    return true;
}

bool loadNpyFile(const std::string& path, Numeric& out, ErrorStream& errors){
    std::ifstream in(path, std::ios::binary);
    if(!in.is_open()){
        errors.fail(FILE_NOT_FOUND, path);
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    return readNpy(buffer.str(), path, out, errors);
}

bool parseText(std::string_view text, Numeric& out, ErrorStream& errors){
    std::vector<std::vector<double>> rows;

    size_t line_start = 0;
    while(line_start <= text.size()){
        size_t line_end = text.find('\n', line_start);
        if(line_end == std::string_view::npos) line_end = text.size();
        std::string line(text.substr(line_start, line_end-line_start));
        line_start = line_end + 1;

        const size_t comment = line.find('#');
        if(comment != std::string::npos) line.resize(comment);

        std::istringstream fields(line);
        std::vector<double> row;
        std::string field;
        while(fields >> field){
            char* end = nullptr;
            const double val = std::strtod(field.c_str(), &end);
            if(end != field.c_str() + field.size()){
                errors.fail(STDIN_UNPARSEABLE, "could not convert string to float: '" + field + "'");
                return false;
            }
            row.push_back(val);
        }

        if(row.empty()) continue;
        if(!rows.empty() && row.size() != rows.front().size()){
            errors.fail(STDIN_UNPARSEABLE,
                "the number of columns changed from " + std::to_string(rows.front().size()) +
                " to " + std::to_string(row.size()) + " at row " + std::to_string(rows.size()+1));
            return false;
        }
        rows.push_back(std::move(row));
    }

    const size_t num_rows = rows.size();
    const size_t num_cols = rows.empty() ? 0 : rows.front().size();

    if(num_rows == 1 && num_cols == 1){
        out = rows.front().front();
    }else if(num_rows == 1){
        out = Eigen::VectorXd(Eigen::Map<const Eigen::VectorXd>(rows.front().data(), num_cols));
    }else if(num_cols <= 1){
        Eigen::VectorXd v(num_rows);
        for(size_t i = 0; i < num_rows; i++) v[i] = rows[i].front();
        out = std::move(v);
    }else{
        Eigen::MatrixXd m(num_rows, num_cols);
        for(size_t i = 0; i < num_rows; i++)
            for(size_t j = 0; j < num_cols; j++)
                m(i, j) = rows[i][j];
        out = std::move(m);
    }

    return true;
}

bool parseStdinBytes(std::string_view bytes, std::optional<Numeric>& out, ErrorStream& errors){
    out.reset();
    if(bytes.empty()) return true;

    Numeric value;
    if(isNpy(bytes)){
        logger->debug("Reading piped input as .npy ({:d} bytes)", bytes.size());
        if(!readNpy(bytes, "stdin", value, errors)) return false;
    }else{
        logger->debug("Reading piped input as text ({:d} bytes)", bytes.size());
        if(!parseText(bytes, value, errors)) return false;
    }

    out = std::move(value);
    return true;
}

bool stdinIsPiped() noexcept {
    return !isatty(fileno(stdin));
}

bool readFromStdin(std::optional<Numeric>& out, ErrorStream& errors){
    out.reset();
    if(!stdinIsPiped()) return true;

    std::string bytes((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    return parseStdinBytes(bytes, out, errors);
}

}

}
