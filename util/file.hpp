#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes the given content to a file. The file is first written to a
  // temporary file in the same folder and then moved in place, so readers
  // never see a partially written file.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Changes the permission bits of a file.
  static void SetMode(const std::string& path, int mode);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Prepends the current directory to a relative path.
  static std::string AbsolutePath(const std::string& path);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&& other) noexcept;
  TempDir& operator=(TempDir&&) = delete;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
