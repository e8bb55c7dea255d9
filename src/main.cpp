//! # semdiff Entry Point
//!
//! Compares two versions of a Rust source tree and reports, per function,
//! type, trait and method, what changed between them.
//!
//! ## Usage
//!
//! ```bash
//! semdiff https://github.com/org/repo.git ./repo main 3f2c1ab out/
//! semdiff --base-dir=old/ --target-dir=new/ out/
//! ```
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return semdiff_main(argc, argv);
}
