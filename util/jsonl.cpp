#include "util/jsonl.hpp"

#include <fcntl.h>
#include <unistd.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"

namespace util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw json_error("Cannot serialize " + message.GetTypeName() + ": " +
                     status.ToString());
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw json_error("Invalid " + message->GetTypeName() + ": " +
                     status.ToString());
  }
}

namespace internal {

std::vector<std::pair<size_t, std::string>> ReadLines(const std::string& path) {
  std::string content = File::Read(path);
  std::vector<std::pair<size_t, std::string>> lines;
  size_t number = 0;
  for (absl::string_view line : absl::StrSplit(content, '\n')) {
    number++;
    if (absl::StripAsciiWhitespace(line).empty()) continue;
    lines.emplace_back(number, std::string(line));
  }
  return lines;
}

}  // namespace internal

JsonlWriter::JsonlWriter(const std::string& path) : path_(path) {
  File::MakeDirs(File::BaseDir(path));
  fd_ = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  if (fd_ == -1)
    throw std::system_error(errno, std::system_category(), "open " + path);
}

void JsonlWriter::Write(const google::protobuf::Message& message) {
  std::string line = ToJson(message) + "\n";
  size_t pos = 0;
  while (pos < line.size()) {
    ssize_t written = write(fd_, line.c_str() + pos, line.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(), "write " + path_);
    }
    pos += written;
  }
}

JsonlWriter::~JsonlWriter() {
  if (fd_ != -1) close(fd_);
}

}  // namespace util
