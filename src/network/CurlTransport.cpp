#include "CurlTransport.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <stdexcept>
#include "../../config/Config.hpp"
#include "../errors/ClientError.hpp"
#include "../utils/Logger.hpp"

namespace {

// State of a single cURL easy handle transfer
struct TransferContext {
    std::string url;
    std::string body;
    std::string response;
    curl_slist* headers = nullptr;
    std::shared_ptr<std::promise<HonestMark::HttpResponse>> promise;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    ~TransferContext() {
        if (headers) curl_slist_free_all(headers);
    }
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;
    try {
        ctx->response.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return chunk;
}

CURL* CreateEasyHandle(const HonestMark::HttpRequest& request, TransferContext* ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    const auto& config = HonestMark::Config::GetInstance();

    for (const auto& header : request.headers) {
        ctx->headers = curl_slist_append(ctx->headers, (header.first + ": " + header.second).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, ctx->url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, ctx->body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(ctx->body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, ctx->headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, ctx);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.http_user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config.http_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.http_connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, ctx);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);

    return curl;
}

} // anonymous namespace

namespace HonestMark {

CurlTransport::CurlTransport() {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&CurlTransport::Run, this);
}

CurlTransport::~CurlTransport() {
    Close();
}

HttpResponse CurlTransport::Send(const HttpRequest& request) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw ClientClosedError("Transport is closed");
        }
        pending_requests_.push_back({request, promise});
        curl_multi_wakeup(multi_handle_);
    }
    return future.get();
}

void CurlTransport::Close() {
    std::call_once(close_once_, [this] {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        curl_multi_wakeup(multi_handle_);
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        curl_multi_cleanup(multi_handle_);
        multi_handle_ = nullptr;
        Logger::Log(LogLevel::Debug, "CurlTransport closed.");
    });
}

void CurlTransport::Run() {
    Logger::Log(LogLevel::Debug, "CurlTransport worker thread started.");
    int still_running = 0;

    while (true) {
        std::vector<Pending> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) break;
            std::swap(batch, pending_requests_);
        }

        StartTransfers(batch);

        CURLMcode rc = curl_multi_perform(multi_handle_, &still_running);
        if (rc != CURLM_OK) {
            Logger::Log(LogLevel::Error, std::string("curl_multi_perform failed: ") + curl_multi_strerror(rc));
        }
        CollectFinished();

        // Sleeps until socket activity, a wakeup from Send()/Close(), or the timeout
        curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
    }

    AbortAll();
}

void CurlTransport::StartTransfers(std::vector<Pending>& batch) {
    for (auto& pending : batch) {
        auto* ctx = new TransferContext{};
        ctx->url = pending.request.url;
        ctx->body = pending.request.body;
        ctx->promise = pending.promise;

        CURL* easy_handle = CreateEasyHandle(pending.request, ctx);
        if (!easy_handle) {
            pending.promise->set_exception(std::make_exception_ptr(TransportError("Failed to create cURL easy handle for: " + ctx->url)));
            delete ctx;
            continue;
        }
        curl_multi_add_handle(multi_handle_, easy_handle);
        in_flight_.insert(easy_handle);
        Logger::Log(LogLevel::Debug, "Started " + pending.request.method + " " + ctx->url);
    }
}

void CurlTransport::CollectFinished() {
    int msgs_in_queue = 0;
    CURLMsg* msg;
    while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
        if (msg->msg != CURLMSG_DONE) continue;

        CURL* easy_handle = msg->easy_handle;
        TransferContext* ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &ctx);

        if (msg->data.result == CURLE_OK) {
            HttpResponse response;
            curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
            response.body = std::move(ctx->response);
            ctx->promise->set_value(std::move(response));
        } else {
            std::string error = ctx->error_buffer;
            if (error.empty()) {
                error = curl_easy_strerror(msg->data.result);
            }
            Logger::Log(LogLevel::Error, "Transfer to " + ctx->url + " failed: " + error);
            ctx->promise->set_exception(std::make_exception_ptr(TransportError(error)));
        }

        in_flight_.erase(easy_handle);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        delete ctx;
    }
}

void CurlTransport::AbortAll() {
    for (CURL* easy_handle : in_flight_) {
        TransferContext* ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &ctx);
        ctx->promise->set_exception(std::make_exception_ptr(ClientClosedError("Transport closed during transfer")));
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        delete ctx;
    }
    in_flight_.clear();

    std::vector<Pending> never_started;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        std::swap(never_started, pending_requests_);
    }
    for (auto& pending : never_started) {
        pending.promise->set_exception(std::make_exception_ptr(ClientClosedError("Transport closed before the request was sent")));
    }
}

}
