#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace perpscalp {
namespace common {

// Fixed-capacity circular buffer with a write cursor. push() is O(1) and
// hands back the element it overwrote so rolling sums can be maintained.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : data_(capacity == 0 ? 1 : capacity), head_(0), count_(0) {}

    std::optional<T> push(const T& value) {
        std::optional<T> evicted;
        if (count_ == data_.size()) {
            evicted = data_[head_];
        } else {
            ++count_;
        }
        data_[head_] = value;
        head_ = (head_ + 1) % data_.size();
        return evicted;
    }

    // 0 = oldest retained element
    const T& at(std::size_t index) const {
        if (index >= count_) {
            throw std::out_of_range("RingBuffer::at");
        }
        return data_[(start() + index) % data_.size()];
    }

    const T& back() const { return at(count_ - 1); }
    const T& front() const { return at(0); }

    std::vector<T> toVector() const {
        std::vector<T> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return data_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == data_.size(); }

private:
    std::size_t start() const {
        return (head_ + data_.size() - count_) % data_.size();
    }

    std::vector<T> data_;
    std::size_t head_;
    std::size_t count_;
};

} // namespace common
} // namespace perpscalp
