#ifndef LINALG_COMMON_H
#define LINALG_COMMON_H

#include <cassert>
#include <cstddef>
#include <limits>
#include <parallel_hashmap/phmap.h>
#include <unordered_set>

#define LINALG_UNORDERED_MAP phmap::flat_hash_map
#define LINALG_STATIC_MAP const phmap::flat_hash_map
#define LINALG_UNORDERED_SET std::unordered_set
#define LINALG_STATIC_SET const std::unordered_set

//Allocation failure is not recoverable
#define alloc_except noexcept

namespace Linalg {

typedef size_t ParseNode;
extern inline constexpr size_t NONE = std::numeric_limits<size_t>::max();

#ifndef NDEBUG
#define DEBUG_INIT_NONE =NONE
#else
#define DEBUG_INIT_NONE
#endif

class Program;

namespace Code {
struct Error;
class ErrorStream;
class ParseTree;
}

}

#endif // LINALG_COMMON_H
