#ifndef SANDBOX_OUTPUT_CAPTURE_HPP
#define SANDBOX_OUTPUT_CAPTURE_HPP

#include <cstddef>
#include <string>

namespace sandbox {

// Accumulates a stream of bytes keeping at most `limit` bytes from its start,
// plus the last `tail_size` bytes of the whole stream. Bytes in between are
// only counted.
class OutputCapture {
 public:
  static const constexpr size_t kDefaultTailSize = 4096;

  OutputCapture() : OutputCapture(0) {}
  explicit OutputCapture(size_t limit, size_t tail_size = kDefaultTailSize)
      : limit_(limit), tail_size_(tail_size) {}

  void Append(const char* data, size_t size);
  void Append(const std::string& data) { Append(data.data(), data.size()); }

  // First `limit` bytes of the stream.
  const std::string& Head() const { return head_; }
  // Last `tail_size` bytes of the stream.
  const std::string& Tail() const { return tail_; }
  size_t TotalBytes() const { return total_; }
  bool Truncated() const { return total_ > head_.size(); }

 private:
  size_t limit_;
  size_t tail_size_;
  size_t total_ = 0;
  std::string head_;
  std::string tail_;
};

}  // namespace sandbox

#endif
