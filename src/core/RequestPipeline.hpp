#pragma once
#include <string>
#include "../interfaces/IDocumentCodec.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../model/Document.hpp"

namespace HonestMark {
    // Turns one Document into one POST and one classified response.
    //
    // Prepare() covers validation and encoding and never touches the network;
    // Dispatch() performs exactly one transport call and no retries.
    class RequestPipeline {
    public:
        RequestPipeline(IHttpTransport& transport, IDocumentCodec& codec, std::string api_url, const std::string& auth_token);

        // Throws ValidationError.
        static void Validate(const Document& document, const std::string& signature);

        // Validates and projects the document. Throws ValidationError.
        static DocumentRequest Build(const Document& document, const std::string& signature);

        // Build() plus encoding into a ready-to-send request.
        // Throws ValidationError or EncodingError.
        HttpRequest Prepare(const Document& document, const std::string& signature);

        // Throws TransportError, ClientClosedError or ApiError.
        DocumentResponse Dispatch(const HttpRequest& request);

        // Throws ApiError unless the response is a 200 with a decodable, error-free body.
        DocumentResponse Classify(const HttpResponse& response);

    private:
        IHttpTransport& transport_;
        IDocumentCodec& codec_;
        const std::string api_url_;
        const std::string authorization_;
    };
}
