#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "../interfaces/IHttpFetcher.hpp"
#include "../../config/Config.hpp"

// Forward declare CURLM
typedef void CURLM;

namespace FetchCache {

// Asynchronous HTTP GET over one libcurl multi handle driven by a worker thread.
// curl_global_init() must have been called before construction.
class HttpFetcher : public IHttpFetcher {
public:
    struct Options {
        long timeout_ms = 4000;
        long max_redirects = 5;
        std::string user_agent = "FetchCache/1.0";
        size_t max_body_bytes = 8388608;
    };

    explicit HttpFetcher(Options options);
    explicit HttpFetcher(const Config& config);
    ~HttpFetcher() override;

    // Non-copyable
    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    void Fetch(const std::string& url, Callback cb) override;

private:
    void Run();

    Options options_;
    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        std::string url;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
};

}
