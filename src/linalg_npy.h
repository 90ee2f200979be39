#ifndef LINALG_NPY_H
#define LINALG_NPY_H

#include "linalg_common.h"
#include "linalg_error.h"
#include "linalg_value.h"
#include <string>
#include <string_view>

namespace Linalg {

namespace Code {

static constexpr std::string_view NPY_MAGIC = "\x93NUMPY";

bool isNpy(std::string_view bytes) noexcept;

//Decodes an in-memory .npy file of rank 0, 1 or 2. Failures are reported with the given source name.
bool readNpy(std::string_view bytes, std::string_view source, Numeric& out, ErrorStream& errors);

//Encodes as format 1.0, '<f8', C order
std::string writeNpy(const Numeric& n) alloc_except;

}

}

#endif // LINALG_NPY_H
