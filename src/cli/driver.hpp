//! # CLI Driver Interface
//!
//! This header defines the main entry point for jstub.

#pragma once

// Main driver entry point
int jstub_main(int argc, char* argv[]);
