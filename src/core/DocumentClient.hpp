#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include "AdmissionGate.hpp"
#include "CancellationToken.hpp"
#include "JobScheduler.hpp"
#include "RequestPipeline.hpp"
#include "../interfaces/IDocumentCodec.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../model/Document.hpp"
#include "../utils/QuotaTracker.hpp"
#include "../utils/ThreadPool.hpp"

namespace HonestMark {
    struct ClientOptions {
        std::chrono::milliseconds window_length = std::chrono::minutes(1);
        int request_limit = 0;
        std::string auth_token;
        std::string api_url = "https://ismp.crpt.ru/api/v3/lk/documents/create";
        size_t worker_threads = 4;
    };

    // Thread-safe client for the create-document endpoint, limited to
    // `request_limit` requests per `window_length`.
    class DocumentClient {
    public:
        // Throws std::invalid_argument on a non-positive limit or window, an
        // empty token, or zero worker threads.
        DocumentClient(const ClientOptions& options,
                       std::unique_ptr<IHttpTransport> transport,
                       std::unique_ptr<IDocumentCodec> codec = nullptr);
        ~DocumentClient();

        DocumentClient(const DocumentClient&) = delete;
        DocumentClient& operator=(const DocumentClient&) = delete;

        // Validation and encoding failures come back through the future without
        // any network call. Otherwise the request waits for a permit, is sent once,
        // and the future yields the response or ApiError/TransportError.
        std::future<DocumentResponse> Submit(const Document& document, const std::string& signature,
                                             CancellationToken token = {});

        // Releases the transport. Idempotent; later Submit() calls fail with ClientClosedError.
        void Close();
        bool IsClosed() const { return closed_.load(); }

    private:
        std::unique_ptr<IHttpTransport> transport_;
        std::unique_ptr<IDocumentCodec> codec_;
        QuotaTracker tracker_;
        ThreadPool pool_;
        JobScheduler scheduler_;
        AdmissionGate gate_;
        RequestPipeline pipeline_;
        std::atomic<bool> closed_{false};
    };
}
