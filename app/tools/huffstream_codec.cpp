#include <iomanip>
#include <iostream>
#include <string>
#include "Codec.h"
#include "Logger.h"
#include "Version.h"

using namespace HuffStream;

namespace {
    void printUsage(const char* program) {
        std::cout << "HuffStream Codec " << Version::toString() << " (payload format " << Version::PAYLOAD_FORMAT << ")" << std::endl;
        std::cout << "\nUsage: " << program << " [--verbose] <encode|decode> <INPUT> <OUTPUT>" << std::endl;
        std::cout << "\nCommands:" << std::endl;
        std::cout << "  encode <IN> <OUT>          Huffman-encode IN into OUT" << std::endl;
        std::cout << "  decode <IN> <OUT>          Decode a payload produced by encode" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Codec");
    logger.setLevel(LogLevel::WARN);

    int first = 1;
    if (argc > 1 && std::string(argv[1]) == "--verbose") {
        logger.setLevel(LogLevel::DEBUG);
        ++first;
    }
    if (argc > 1 && std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return 0;
    }
    if (argc - first != 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[first];
    std::string input = argv[first + 1];
    std::string output = argv[first + 2];

    if (command == "encode") {
        auto result = Codec::encodeFile(input, output);
        if (!result) {
            std::cerr << "Error: " << result.error().message << std::endl;
            return 1;
        }
        std::cout << "Encoded size: " << result->payload.size() << " bytes (metadata "
                  << result->metadataSize << ", packed " << result->packedSize << ")" << std::endl;
        std::cout << "Compression ratio: " << std::fixed << std::setprecision(2) << result->ratio << "%" << std::endl;
        return 0;
    }

    if (command == "decode") {
        auto result = Codec::decodeFile(input, output);
        if (!result) {
            std::cerr << "Error: " << result.error().message << std::endl;
            return 1;
        }
        std::cout << "Decoded size: " << result.value() << " bytes" << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
