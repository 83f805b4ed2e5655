#pragma once
#include <string>
#include <random>
#include <sstream>

namespace snipvisor::core::config {

    // Generates a simple 8-character hex ID, e.g. "sv-3fa09c1d".
    inline std::string generate_instance_id(const std::string& prefix = "sv-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace snipvisor::core::config
