#pragma once
#include <string>
#include <random>
#include <sstream>

namespace toolwire::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "session-3fa0c21b"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_session_id() {
        return generate_id("session");
    }

} // namespace toolwire::core::config
