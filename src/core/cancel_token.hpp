#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

// Shared cancellation flag. wait_for() sleeps but wakes early on cancel(),
// so poll loops observe cancellation at their next iteration boundary.
class CancelToken {
public:
    // A token that is cancelled whenever `parent` is, but whose own cancel()
    // leaves the parent untouched.
    static std::shared_ptr<CancelToken> linked(const std::shared_ptr<CancelToken>& parent) {
        auto child = std::make_shared<CancelToken>();
        bool parent_cancelled;
        {
            std::lock_guard<std::mutex> lock(parent->mutex_);
            auto& kids = parent->children_;
            kids.erase(std::remove_if(kids.begin(), kids.end(),
                                      [](const std::weak_ptr<CancelToken>& w) { return w.expired(); }),
                       kids.end());
            kids.push_back(child);
            parent_cancelled = parent->cancelled_;
        }
        if (parent_cancelled) child->cancel();
        return child;
    }

    void cancel() {
        std::vector<std::weak_ptr<CancelToken>> kids;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            kids.swap(children_);
        }
        cv_.notify_all();
        for (auto& w : kids) {
            if (auto child = w.lock()) child->cancel();
        }
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Returns true if cancelled before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::vector<std::weak_ptr<CancelToken>> children_;
};
