#include "DocumentClient.hpp"
#include "../codec/DefaultDocumentCodec.hpp"
#include "../errors/ClientError.hpp"
#include "../utils/Logger.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace HonestMark {

namespace {

const ClientOptions& Checked(const ClientOptions& options) {
    if (options.auth_token.empty()) {
        throw std::invalid_argument("Auth token must not be empty");
    }
    if (options.worker_threads == 0) {
        throw std::invalid_argument("At least one worker thread is required");
    }
    return options;
}

template <typename T>
std::unique_ptr<T> Required(std::unique_ptr<T> ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string(what) + " must not be null");
    }
    return ptr;
}

std::future<DocumentResponse> Failed(std::exception_ptr error) {
    std::promise<DocumentResponse> promise;
    promise.set_exception(error);
    return promise.get_future();
}

} // anonymous namespace

DocumentClient::DocumentClient(const ClientOptions& options,
                               std::unique_ptr<IHttpTransport> transport,
                               std::unique_ptr<IDocumentCodec> codec)
    : transport_(Required(std::move(transport), "Transport")),
      codec_(codec ? std::move(codec) : std::unique_ptr<IDocumentCodec>(std::make_unique<DefaultDocumentCodec>())),
      tracker_(Checked(options).window_length, options.request_limit),
      pool_(options.worker_threads),
      scheduler_(pool_),
      gate_(tracker_, pool_, scheduler_),
      pipeline_(*transport_, *codec_, options.api_url, options.auth_token) {
    Logger::Log(LogLevel::Info, "DocumentClient ready: " + std::to_string(options.request_limit) + " request(s) per " +
        std::to_string(options.window_length.count()) + " ms, " + std::to_string(options.worker_threads) + " worker(s)");
}

DocumentClient::~DocumentClient() {
    Close();
    // Pool tasks may schedule re-checks and the scheduler feeds the pool, so the
    // scheduler stops first and the pool drains before any member is destroyed.
    scheduler_.Stop();
    pool_.Shutdown();
}

std::future<DocumentResponse> DocumentClient::Submit(const Document& document, const std::string& signature,
                                                     CancellationToken token) {
    if (closed_.load()) {
        return Failed(std::make_exception_ptr(ClientClosedError("Client is closed")));
    }

    HttpRequest request;
    try {
        request = pipeline_.Prepare(document, signature);
    } catch (const ClientError& e) {
        Logger::Log(LogLevel::Warn, "Document rejected before sending: " + std::string(e.what()));
        return Failed(std::current_exception());
    }

    Logger::Log(LogLevel::Info, "Submitting " + ToString(*document.type()) + " document for group " +
        ToString(*document.product_group()));
    return gate_.Execute<DocumentResponse>([this, request = std::move(request)]() {
        if (closed_.load()) {
            throw ClientClosedError("Client closed while the request was waiting for quota");
        }
        return pipeline_.Dispatch(request);
    }, std::move(token));
}

void DocumentClient::Close() {
    if (closed_.exchange(true)) return;
    transport_->Close();
    Logger::Log(LogLevel::Info, "DocumentClient closed.");
}

}
