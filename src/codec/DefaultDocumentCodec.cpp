#include "DefaultDocumentCodec.hpp"
#include "DocumentCodec.hpp"

namespace HonestMark {

std::string DefaultDocumentCodec::EncodeRequest(const DocumentRequest& request) {
    return DocumentCodec::Encode(request);
}

DocumentResponse DefaultDocumentCodec::DecodeResponse(const std::string& body) {
    return DocumentCodec::Decode(body);
}

}
