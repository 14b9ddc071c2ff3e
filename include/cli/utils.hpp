//! # CLI Utilities Interface
//!
//! | Function            | Description                                   |
//! |---------------------|-----------------------------------------------|
//! | `print_usage()`     | Print CLI help text                           |
//! | `print_version()`   | Print tool version                            |
//! | `print_failure()`   | Print `error: stage ...` and the hint         |
//! | `print_warnings()`  | Print collected non-fatal warnings            |

#ifndef RELPACK_CLI_UTILS_HPP
#define RELPACK_CLI_UTILS_HPP

#include "common.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace relpack::cli {

void print_usage();
void print_version();

void print_failure(std::ostream& out, const std::string& stage, const PackError& error);
void print_warnings(std::ostream& out, const std::vector<std::string>& warnings);

} // namespace relpack::cli

#endif // RELPACK_CLI_UTILS_HPP
