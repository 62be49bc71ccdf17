#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../model/Document.hpp"

namespace HonestMark {
    void to_json(nlohmann::json& j, const DocumentRequest& request);
    void from_json(const nlohmann::json& j, DocumentResponse& response);

    // JSON wire format of the create-document endpoint.
    class DocumentCodec {
    public:
        static std::string Encode(const DocumentRequest& request);
        static DocumentResponse Decode(const std::string& body);
    };
}
