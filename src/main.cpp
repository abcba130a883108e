/**
 * Copyright (c) 2026 rid2name authors
 */
#include "cli.h"

int main(int argc, char** argv) {
    return r2n::cli::run_main(argc, argv);
}
