#pragma once

namespace FetchCache {

class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;
    virtual bool TryAcquire() = 0;
};

}
