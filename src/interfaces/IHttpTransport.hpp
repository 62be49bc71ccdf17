#pragma once
#include <string>
#include <utility>
#include <vector>

namespace HonestMark {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    // Blocks until the exchange finishes. Throws TransportError on connection/IO failure
    // and ClientClosedError once Close() has been called.
    virtual HttpResponse Send(const HttpRequest& request) = 0;
    // Releases connection resources. Idempotent.
    virtual void Close() = 0;
};

}
