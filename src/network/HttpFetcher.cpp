#include "HttpFetcher.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string url;
    std::string buffer;
    size_t max_bytes;
    bool truncated = false;
    FetchCache::IHttpFetcher::Callback callback;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    size_t current_size = ctx->buffer.size();
    if (current_size >= ctx->max_bytes) {
        ctx->truncated = true;
        return 0; // Abort: the body cap is reached
    }

    size_t to_copy = std::min(chunk, ctx->max_bytes - current_size);
    try {
        ctx->buffer.append(static_cast<char*>(contents), to_copy);
    } catch (const std::bad_alloc&) {
        return 0;
    }

    if (to_copy < chunk) {
        ctx->truncated = true;
        return 0;
    }
    return chunk;
}

CURL* CreateEasyHandle(const FetchCache::HttpFetcher::Options& options, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, transfer_ctx->url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

void Deliver(TransferContext& ctx, FetchCache::HttpResult result) {
    if (!ctx.callback) return;
    try {
        ctx.callback(std::move(result));
    } catch (const std::exception& e) {
        FetchCache::Logger::Log(FetchCache::LogLevel::Error, "Exception in fetch callback for " + ctx.url + ": " + e.what());
    }
}

} // anonymous namespace

namespace FetchCache {

HttpFetcher::HttpFetcher(Options options) : options_(std::move(options)) {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpFetcher::Run, this);
}

HttpFetcher::HttpFetcher(const Config& config)
    : HttpFetcher(Options{config.http_timeout_ms, config.http_max_redirects, config.http_user_agent, config.max_body_bytes}) {}

HttpFetcher::~HttpFetcher() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    curl_multi_cleanup(multi_handle_);
}

void HttpFetcher::Fetch(const std::string& url, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            lock.unlock();
            HttpResult result;
            result.error = "HTTP fetcher is shutting down";
            cb(std::move(result));
            return;
        }
        pending_requests_.push_back({url, std::move(cb)});
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
}

void HttpFetcher::Run() {
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread started.");
    int still_running = 0;
    bool stopping = false;
    std::vector<CURL*> active;

    while (!stopping) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            stopping = stop_;
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto* transfer_ctx = new TransferContext{req.url, "", options_.max_body_bytes, false, std::move(req.callback)};
            CURL* easy_handle = CreateEasyHandle(options_, transfer_ctx);
            if (easy_handle) {
                curl_multi_add_handle(multi_handle_, easy_handle);
                active.push_back(easy_handle);
                Logger::Log(LogLevel::Debug, "Added easy handle for URL: " + req.url);
            } else {
                Logger::Log(LogLevel::Error, "Failed to create cURL easy handle for: " + req.url);
                HttpResult result;
                result.error = "Failed to create cURL easy handle";
                Deliver(*transfer_ctx, std::move(result));
                delete transfer_ctx;
            }
        }

        if (!stopping) {
            curl_multi_perform(multi_handle_, &still_running);
        }

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg != CURLMSG_DONE) continue;

            CURL* easy_handle = msg->easy_handle;
            TransferContext* transfer_ctx = nullptr;
            curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

            HttpResult result;
            result.content = std::move(transfer_ctx->buffer);
            result.truncated = transfer_ctx->truncated;

            if (msg->data.result == CURLE_OK || (transfer_ctx->truncated && msg->data.result == CURLE_WRITE_ERROR)) {
                curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
                char* eff_url = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
                if (eff_url) result.effective_url = eff_url;
            } else {
                result.error = transfer_ctx->error_buffer;
                if (result.error.empty()) {
                    result.error = curl_easy_strerror(msg->data.result);
                }
            }

            curl_multi_remove_handle(multi_handle_, easy_handle);
            curl_easy_cleanup(easy_handle);
            active.erase(std::remove(active.begin(), active.end(), easy_handle), active.end());
            Deliver(*transfer_ctx, std::move(result));
            delete transfer_ctx;
        }

        if (!stopping && still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    // Transfers still running at shutdown are failed so every callback runs once
    for (CURL* easy_handle : active) {
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (transfer_ctx) {
            HttpResult result;
            result.error = "HTTP fetcher is shutting down";
            Deliver(*transfer_ctx, std::move(result));
            delete transfer_ctx;
        }
    }
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread stopped.");
}

}
