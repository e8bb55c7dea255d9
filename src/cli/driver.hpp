//! # Driver Interface
//!
//! `semdiff_main()` parses the command line and runs the diff command.

#pragma once

// Main driver entry point
int semdiff_main(int argc, char* argv[]);
