#pragma once

#include <atomic>
#include <memory>

// One-shot stop flag shared between a session and the transfer it started.
// A session replaces its token on every start, so a worker only ever sees
// its own token fire.
class CancelToken {
public:
    void fire() { fired_.store(true); }
    bool fired() const { return fired_.load(); }

private:
    std::atomic<bool> fired_{ false };
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
