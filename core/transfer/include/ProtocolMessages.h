#pragma once

#include <json/json.h>
#include <cstdint>
#include <string>

namespace HuffStream {

/**
 * @brief JSON bodies exchanged on the control and data channels.
 *
 * Control requests:  {"command":"prepare"|"status"|"cancel","transfer_id":s,...}
 * Control replies:   {"status":...,"transfer_id":s} or {"status":"error","message":s}
 * Data handshake:    {"transfer_id":s}
 */
class ProtocolMessages {
public:
    static Json::Value prepare(const std::string& transferId, const std::string& filename, uint64_t filesize);
    static Json::Value status(const std::string& transferId);
    static Json::Value cancel(const std::string& transferId);
    static Json::Value dataHandshake(const std::string& transferId);

    static Json::Value reply(const std::string& status, const std::string& transferId);
    static Json::Value error(const std::string& message);

    /// Compact single-line encoding
    static std::string toString(const Json::Value& value);

    /**
     * @brief Parse a JSON text strictly (one value, no trailing garbage)
     * @param errors Receives the parser diagnostics on failure
     */
    static bool parse(const std::string& text, Json::Value& out, std::string& errors);
};

} // namespace HuffStream
