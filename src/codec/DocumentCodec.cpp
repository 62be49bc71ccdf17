#include "DocumentCodec.hpp"
#include "../errors/ClientError.hpp"

namespace HonestMark {

namespace {

// Missing and null members both read as empty; any other non-string is malformed.
std::string OptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw EncodingError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

void to_json(nlohmann::json& j, const DocumentRequest& request) {
    j = nlohmann::json{
        {"productDocument", request.product_document},
        {"productGroup", request.product_group},
        {"documentFormat", ToString(request.document_format)},
        {"type", ToString(request.type)},
        {"signature", request.signature},
    };
}

void from_json(const nlohmann::json& j, DocumentResponse& response) {
    if (!j.is_object()) {
        throw EncodingError("Response body is not a JSON object");
    }
    response.value = OptionalString(j, "value");
    response.error_code = OptionalString(j, "errorCode");
    response.error_message = OptionalString(j, "errorMessage");
    response.error_description = OptionalString(j, "errorDescription");
}

std::string DocumentCodec::Encode(const DocumentRequest& request) {
    try {
        return nlohmann::json(request).dump();
    } catch (const nlohmann::json::exception& e) {
        // dump() rejects strings that are not valid UTF-8
        throw EncodingError("Failed to encode document request: " + std::string(e.what()));
    }
}

DocumentResponse DocumentCodec::Decode(const std::string& body) {
    try {
        return nlohmann::json::parse(body).get<DocumentResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw EncodingError(e.what());
    }
}

}
