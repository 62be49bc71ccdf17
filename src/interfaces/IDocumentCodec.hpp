#pragma once
#include <string>
#include "../model/Document.hpp"

namespace HonestMark {

// Both directions throw EncodingError on malformed input.
class IDocumentCodec {
public:
    virtual ~IDocumentCodec() = default;
    virtual std::string EncodeRequest(const DocumentRequest& request) = 0;
    virtual DocumentResponse DecodeResponse(const std::string& body) = 0;
};

}
