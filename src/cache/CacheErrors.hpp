#pragma once
#include <stdexcept>
#include <string>

namespace FetchCache {

// Raised through the returned future when Get() has neither a per-call nor a
// configured fetcher. No entry is created for the key.
class MissingFetcherError : public std::runtime_error {
public:
    explicit MissingFetcherError(const std::string& key);
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Every copy of a FetchCompletion was destroyed before the producer settled it.
class FetchAbandonedError : public std::runtime_error {
public:
    FetchAbandonedError();
};

// A producer called Reject() with an empty exception_ptr.
class EmptyRejectionError : public std::runtime_error {
public:
    EmptyRejectionError();
};

}
