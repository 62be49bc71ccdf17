#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>
#include "../interfaces/IHttpTransport.hpp"

// Forward declare cURL handles
typedef void CURLM;
typedef void CURL;

namespace HonestMark {

// libcurl transport. One worker thread drives a multi handle, so connections
// are pooled across every call made through this instance. Send() blocks the
// calling thread until its transfer completes.
//
// curl_global_init() must have been called before construction.
class CurlTransport : public IHttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse Send(const HttpRequest& request) override;
    void Close() override;

private:
    struct Pending {
        HttpRequest request;
        std::shared_ptr<std::promise<HttpResponse>> promise;
    };

    void Run();
    void StartTransfers(std::vector<Pending>& batch);
    void CollectFinished();
    void AbortAll();

    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::vector<Pending> pending_requests_;
    bool stop_ = false;
    std::once_flag close_once_;

    // Touched by the worker thread only
    std::unordered_set<CURL*> in_flight_;
};

}
