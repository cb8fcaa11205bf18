#pragma once

#include <iostream>

namespace scout {

constexpr const char* VERSION = "0.3.0";

inline void print_version() {
    std::cout << "scout " << VERSION << std::endl;
}

}  // namespace scout
