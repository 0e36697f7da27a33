#include "ProtocolMessages.h"
#include <memory>

namespace HuffStream {

Json::Value ProtocolMessages::prepare(const std::string& transferId, const std::string& filename,
                                      uint64_t filesize) {
    Json::Value msg(Json::objectValue);
    msg["command"] = "prepare";
    msg["transfer_id"] = transferId;
    msg["filename"] = filename;
    msg["filesize"] = static_cast<Json::UInt64>(filesize);
    return msg;
}

Json::Value ProtocolMessages::status(const std::string& transferId) {
    Json::Value msg(Json::objectValue);
    msg["command"] = "status";
    msg["transfer_id"] = transferId;
    return msg;
}

Json::Value ProtocolMessages::cancel(const std::string& transferId) {
    Json::Value msg(Json::objectValue);
    msg["command"] = "cancel";
    msg["transfer_id"] = transferId;
    return msg;
}

Json::Value ProtocolMessages::dataHandshake(const std::string& transferId) {
    Json::Value msg(Json::objectValue);
    msg["transfer_id"] = transferId;
    return msg;
}

Json::Value ProtocolMessages::reply(const std::string& status, const std::string& transferId) {
    Json::Value msg(Json::objectValue);
    msg["status"] = status;
    msg["transfer_id"] = transferId;
    return msg;
}

Json::Value ProtocolMessages::error(const std::string& message) {
    Json::Value msg(Json::objectValue);
    msg["status"] = "error";
    msg["message"] = message;
    return msg;
}

std::string ProtocolMessages::toString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool ProtocolMessages::parse(const std::string& text, Json::Value& out, std::string& errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

} // namespace HuffStream
