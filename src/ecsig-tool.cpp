// ECSIG Tool - Signature Conversion Command Line Interface
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include <ecsig/tool/tool.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        return ecsig::tool::RunTool(argc, argv, {std::cin, std::cout, std::cerr});
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ecsig::tool::EXIT_USAGE;
    }
}
