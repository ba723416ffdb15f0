#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stack>
#include <vector>

namespace ferry {

/**
 * @brief Recycles chunk-sized byte buffers between engine workers.
 *
 * @details
 * Buffers come back through the shared_ptr deleter. At most `max_idle`
 * buffers are retained, the rest are freed on release, so a burst of
 * parallel workers does not pin its peak memory forever.
 * **Thread Safety:** Acquire and release are mutex-protected. The pool must
 * outlive every buffer it hands out.
 */
class BufferPool {
   public:
    using Buffer = std::vector<std::uint8_t>;
    using BufferPtr = std::shared_ptr<Buffer>;

    explicit BufferPool(std::size_t max_idle = 8) : max_idle_(max_idle) {}

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Returns a buffer of exactly `size` bytes (contents unspecified).
     */
    BufferPtr Acquire(std::size_t size) {
        std::unique_ptr<Buffer> raw;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                raw = std::move(idle_.top());
                idle_.pop();
            }
        }
        if (!raw) {
            raw = std::make_unique<Buffer>();
        }
        raw->resize(size);
        return BufferPtr(raw.release(), [this](Buffer* p) { Release(p); });
    }

    std::size_t idle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }

   private:
    void Release(Buffer* p) {
        std::unique_ptr<Buffer> owned(p);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < max_idle_) {
            idle_.push(std::move(owned));
        }
    }

    std::size_t max_idle_;
    std::stack<std::unique_ptr<Buffer>> idle_;
    mutable std::mutex mutex_;
};

}  // namespace ferry
