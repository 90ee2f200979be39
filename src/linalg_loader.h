#ifndef LINALG_LOADER_H
#define LINALG_LOADER_H

#include "linalg_common.h"
#include "linalg_error.h"
#include "linalg_value.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Linalg {

namespace Code {

static constexpr std::string_view PIPE_KEY = "PIPE";
static constexpr std::string_view RESERVED_PIPE_FILE_NAME = "pipe.npy";

//Each path must be an existing X.npy file for a single uppercase letter X.
//Piped data, if present, is stored under PIPE.
bool loadMatrices(const std::vector<std::string>& paths,
                  const std::optional<Numeric>& stdin_value,
                  Environment& environment,
                  ErrorStream& errors);

bool loadNpyFile(const std::string& path, Numeric& out, ErrorStream& errors);

//Whitespace separated rows, '#' comments. Squeezed like numpy.loadtxt.
bool parseText(std::string_view text, Numeric& out, ErrorStream& errors);

//Empty input leaves out unset
bool parseStdinBytes(std::string_view bytes, std::optional<Numeric>& out, ErrorStream& errors);

//Reads nothing when stdin is a terminal
bool readFromStdin(std::optional<Numeric>& out, ErrorStream& errors);

bool stdinIsPiped() noexcept;

}

}

#endif // LINALG_LOADER_H
