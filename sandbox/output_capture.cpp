#include "sandbox/output_capture.hpp"

#include <algorithm>

namespace sandbox {

void OutputCapture::Append(const char* data, size_t size) {
  total_ += size;
  if (head_.size() < limit_) {
    head_.append(data, std::min(size, limit_ - head_.size()));
  }
  if (tail_size_ == 0) return;
  if (size >= tail_size_) {
    tail_.assign(data + size - tail_size_, tail_size_);
    return;
  }
  tail_.append(data, size);
  if (tail_.size() > tail_size_) tail_.erase(0, tail_.size() - tail_size_);
}

}  // namespace sandbox
