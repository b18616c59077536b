#include "CacheErrors.hpp"

namespace FetchCache {

MissingFetcherError::MissingFetcherError(const std::string& key)
    : std::runtime_error("No fetcher configured for key: " + key), key_(key) {}

FetchAbandonedError::FetchAbandonedError()
    : std::runtime_error("Fetch was abandoned without a result") {}

EmptyRejectionError::EmptyRejectionError()
    : std::runtime_error("Fetch was rejected without an error") {}

}
