#ifndef UTIL_JSONL_HPP
#define UTIL_JSONL_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "google/protobuf/message.h"

namespace util {

class json_error : public std::runtime_error {
 public:
  explicit json_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Serializes a message to a single line of JSON, using the field names of the
// .proto file and printing fields that hold their default value.
std::string ToJson(const google::protobuf::Message& message);

// Parses a JSON object into message. Unknown fields are ignored. Throws
// json_error on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

// Reads a JSON Lines file, one message per non-empty line.
template <typename T>
std::vector<T> ReadJsonl(const std::string& path);

// Appends messages to a JSON Lines file. The file is truncated when the writer
// is created and closed when the writer goes out of scope. Not thread safe.
class JsonlWriter {
 public:
  explicit JsonlWriter(const std::string& path);
  void Write(const google::protobuf::Message& message);
  const std::string& Path() const { return path_; }
  ~JsonlWriter();

  JsonlWriter(const JsonlWriter&) = delete;
  JsonlWriter& operator=(const JsonlWriter&) = delete;
  JsonlWriter(JsonlWriter&&) = delete;
  JsonlWriter& operator=(JsonlWriter&&) = delete;

 private:
  std::string path_;
  int fd_ = -1;
};

namespace internal {
// Returns the non-empty lines of a file, paired with their 1-based number.
std::vector<std::pair<size_t, std::string>> ReadLines(const std::string& path);
}  // namespace internal

template <typename T>
std::vector<T> ReadJsonl(const std::string& path) {
  std::vector<T> messages;
  for (const auto& line : internal::ReadLines(path)) {
    T message;
    try {
      FromJson(line.second, &message);
    } catch (const json_error& exc) {
      throw json_error(path + ":" + std::to_string(line.first) + ": " +
                       exc.what());
    }
    messages.push_back(std::move(message));
  }
  return messages;
}

}  // namespace util

#endif
