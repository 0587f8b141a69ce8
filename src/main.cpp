// main.cpp - volmap command-line entry point
#include <iostream>

#include "volmap/volmap.h"

int main(int argc, char* argv[]) {
    volmap::SystemPrivilegeOps ops;
    return volmap::run_cli(argc, argv, ops, std::cout);
}
