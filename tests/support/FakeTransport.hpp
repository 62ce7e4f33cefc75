#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "reqkit/transport/ITransport.hpp"

namespace reqkit::test {

// Answers every request synchronously with a canned response and records what
// it was asked to send.
class FakeTransport final : public ITransport {
public:
    struct Seen {
        RequestDescriptor request;
        SessionConfig     session;
    };

    using Responder = std::function<Result<Response>(const RequestDescriptor&)>;

    FakeTransport() {
        responder_ = [](const RequestDescriptor&) -> Result<Response> {
            Response r;
            r.status = 200;
            r.body = "{}";
            return r;
        };
    }

    void respondWith(Responder fn) {
        std::lock_guard<std::mutex> lk(mx_);
        responder_ = std::move(fn);
    }

    void throwOnPerform(bool on) {
        std::lock_guard<std::mutex> lk(mx_);
        throw_ = on;
    }

    void deliverTwice(bool on) {
        std::lock_guard<std::mutex> lk(mx_);
        twice_ = on;
    }

    void perform(const RequestDescriptor& request,
                 const SessionConfig& session,
                 Completion done) override {
        Responder fn;
        bool doThrow = false, doTwice = false;
        {
            std::lock_guard<std::mutex> lk(mx_);
            seen_.push_back({request, session});
            fn = responder_;
            doThrow = throw_;
            doTwice = twice_;
        }
        cv_.notify_all();
        if (doThrow) throw std::runtime_error("socket exploded");
        auto result = fn(request);
        done(result);
        if (doTwice) done(result);
    }

    std::size_t calls() const {
        std::lock_guard<std::mutex> lk(mx_);
        return seen_.size();
    }

    std::vector<Seen> seen() const {
        std::lock_guard<std::mutex> lk(mx_);
        return seen_;
    }

    // True once at least n requests were performed.
    bool waitForCalls(std::size_t n, std::chrono::milliseconds limit) const {
        std::unique_lock<std::mutex> lk(mx_);
        return cv_.wait_for(lk, limit, [&]{ return seen_.size() >= n; });
    }

private:
    mutable std::mutex              mx_;
    mutable std::condition_variable cv_;
    Responder                       responder_;
    std::vector<Seen>               seen_;
    bool                            throw_{false};
    bool                            twice_{false};
};

} // namespace reqkit::test
