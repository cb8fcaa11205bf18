#include <iostream>

#include "scout/cli/root_command.hpp"

int main(int argc, char* argv[]) {
    try {
        scout::cli::RootCommand root;
        return root.execute(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
