//! # relpack Entry Point
//!
//! `main()` only delegates to the CLI dispatcher (`cli/dispatcher.hpp`),
//! which parses arguments, loads `relpack.toml` and runs the requested stage.
//!
//! ```bash
//! relpack                     # Run every stage
//! relpack build --arch=arm64  # Build one architecture
//! relpack debug dist/My.app   # Interactive debugging menu
//! ```

#include "cli/dispatcher.hpp"

int main(int argc, char* argv[]) {
    return relpack::cli::relpack_main(argc, argv);
}
