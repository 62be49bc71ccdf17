#include "RequestPipeline.hpp"
#include "../errors/ClientError.hpp"
#include "../utils/Logger.hpp"
#include <exception>
#include <utility>

namespace HonestMark {

namespace {

constexpr long kHttpOk = 200;

} // anonymous namespace

RequestPipeline::RequestPipeline(IHttpTransport& transport, IDocumentCodec& codec, std::string api_url, const std::string& auth_token)
    : transport_(transport), codec_(codec), api_url_(std::move(api_url)), authorization_("Bearer " + auth_token) {}

void RequestPipeline::Validate(const Document& document, const std::string& signature) {
    if (!document.document_format()) throw ValidationError("Document format is required");
    if (!document.type()) throw ValidationError("Document type is required");
    if (!document.product_group()) throw ValidationError("Product group is required");
    if (signature.empty()) throw ValidationError("Signature is required");
}

DocumentRequest RequestPipeline::Build(const Document& document, const std::string& signature) {
    Validate(document, signature);

    DocumentRequest request;
    request.product_document = document.product_document();
    request.product_group = ToString(*document.product_group());
    request.document_format = *document.document_format();
    request.type = *document.type();
    request.signature = signature;
    return request;
}

HttpRequest RequestPipeline::Prepare(const Document& document, const std::string& signature) {
    DocumentRequest request = Build(document, signature);

    HttpRequest http;
    http.method = "POST";
    http.url = api_url_;
    http.headers = {
        {"Authorization", authorization_},
        {"Content-Type", "application/json"},
    };
    http.body = codec_.EncodeRequest(request);
    return http;
}

DocumentResponse RequestPipeline::Dispatch(const HttpRequest& request) {
    HttpResponse response;
    try {
        response = transport_.Send(request);
    } catch (const ClientError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransportError(e.what());
    }
    return Classify(response);
}

DocumentResponse RequestPipeline::Classify(const HttpResponse& response) {
    if (response.status_code != kHttpOk) {
        Logger::Log(LogLevel::Warn, "Document service answered with status " + std::to_string(response.status_code));
        throw ApiError("Request failed with status: " + std::to_string(response.status_code) + ", body: " + response.body,
            response.status_code, response.body);
    }

    DocumentResponse parsed;
    try {
        parsed = codec_.DecodeResponse(response.body);
    } catch (const EncodingError& e) {
        throw ApiError("Failed to parse response: " + std::string(e.what()), response.status_code, response.body);
    }

    if (parsed.HasError()) {
        std::string message = parsed.error_message.empty() ? "Upstream error code: " + parsed.error_code : parsed.error_message;
        throw ApiError(message, response.status_code, response.body, parsed.error_code);
    }
    return parsed;
}

}
