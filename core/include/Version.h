#pragma once

#include <string>

namespace HuffStream {
    struct Version {
        static constexpr int MAJOR = 1;
        static constexpr int MINOR = 0;
        static constexpr int PATCH = 0;

        /// Encoded payload layout written by this release (PayloadFormat::VERSION)
        static constexpr int PAYLOAD_FORMAT = 1;

        static std::string toString() {
            return std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
        }
    };
}
