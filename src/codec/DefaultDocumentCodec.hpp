#pragma once
#include "../interfaces/IDocumentCodec.hpp"

namespace HonestMark {

class DefaultDocumentCodec : public IDocumentCodec {
public:
    std::string EncodeRequest(const DocumentRequest& request) override;
    DocumentResponse DecodeResponse(const std::string& body) override;
};

}
