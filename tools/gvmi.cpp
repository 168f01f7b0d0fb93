// =============================================================================
// FILE: tools/gvmi.cpp
// BRIEF: gvmi command-line entry point
// =============================================================================

#include "cli.hpp"

int main(int argc, char* argv[]) {
    return gvmi::cli::run(argc, argv);
}
