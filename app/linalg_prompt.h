#ifndef LINALG_PROMPT_H
#define LINALG_PROMPT_H

#include <string_view>

namespace Linalg {

inline constexpr std::string_view LANGUAGE_REFERENCE = R"LINALG_REF(
# Linalg - Linear Algebra Command-Line Calculator

## Overview
Linalg evaluates a linear algebra expression over matrices loaded from .npy
files or piped on stdin, and prints the result in one of several formats.

    linalg EXPRESSION [FILES...] [options]

## Placeholders
- `{A}` to `{Z}` name the matrix loaded from A.npy to Z.npy
- The file name must be a single uppercase letter followed by .npy
- `{PIPE}` (or `{P}`) is the data piped on stdin, as .npy bytes or whitespace separated text
- 'pipe.npy' is reserved, pipe the data and use `{PIPE}` instead

## Operators (lowest to highest precedence)
- `+` `-`        elementwise addition and subtraction, with broadcasting
- `*` `@`        elementwise product, matrix product
- `^`            integer matrix power of a square matrix, e.g. `{A}^3`, `{A}^-1`
- `-x`           negation
- `{A}.T`        transpose
- `( )`          grouping
- Numeric literals such as `2`, `0.5`, `.25`, `1e3` are scalars

## Functions
- Matrix results:  inv, pinv, matrix_power(A, n), exp, sin, cos
- Scalar results:  det, trace, tr, norm, rank, cond, sum, prod, mean, std
- Decompositions:  svd -> (U, S, Vh), eig -> (values, vectors), qr -> (Q, R),
                   lu -> (P, L, U) with A = P L U, cholesky -> L
- Solvers:         solve(A, b), lstsq(A, b)
- Construction:    eye(n), diag(x), rand(n) / rand(r, c), zeros(n) / zeros(r, c),
                   ones(n) / ones(r, c)

## Output formats (--format)
- `plain`  tab separated values, one value per line for vectors (default)
- `text`   NumPy array2string style
- `csv`    comma separated values
- `json`   nested lists
- `latex`  bmatrix environment
- `table`  boxed table (also --pretty)
- `npy`    binary .npy, written to --output or to stdout with --npy

## Examples
```bash
linalg "{A}+{B}" A.npy B.npy
linalg "tr({A}@{B}.T) + det({A})" A.npy B.npy
linalg "inv({A})" A.npy --format latex --precision 6
linalg "{A}+{B}" A.npy B.npy --npy | linalg "det({PIPE})"
printf '4 1\n1 3\n' | linalg "cholesky({PIPE})"
linalg "svd({A})" A.npy --components --output svd_result
```
Tuple results saved with --components are written to svd_result_0.npy,
svd_result_1.npy, svd_result_2.npy.
)LINALG_REF";

}

#endif // LINALG_PROMPT_H
