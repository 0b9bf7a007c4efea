// Copyright Global Phasing Ltd.
//
// Line-oriented input from files, gzipped files and memory,
// and a unique_ptr wrapper for FILE.

#ifndef ENSFIT_INPUT_HPP_
#define ENSFIT_INPUT_HPP_

#include <cstdio>  // for FILE, fgets, fgetc
#include <cstring> // for memchr, memcpy, strlen
#include <memory>  // for unique_ptr
#include <string>
#include "fail.hpp"  // for sys_fail, ENSFIT_DLL

namespace ensfit {

/// deleter for fileptr_t
struct needs_fclose {
  bool use_fclose;
  void operator()(std::FILE* f) const noexcept {
    if (use_fclose)
      std::fclose(f);
  }
};

typedef std::unique_ptr<std::FILE, needs_fclose> fileptr_t;

inline fileptr_t file_open(const char* path, const char* mode) {
  std::FILE* file = std::fopen(path, mode);
  if (file == nullptr)
    sys_fail(std::string("Failed to open ") + path +
             (*mode == 'w' ? " for writing" : ""));
  return fileptr_t(file, needs_fclose{true});
}

// base class for FileStream, MemoryStream and the gzip stream
struct AnyStream {
  virtual ~AnyStream() = default;

  virtual char* gets(char* line, int size) = 0;
  virtual int getc() = 0;

  /// Returns the line length, 0 at EOF. Lines longer than size-1
  /// are truncated and the rest of the line is skipped.
  size_t copy_line(char* line, int size) {
    if (!gets(line, size))
      return 0;
    size_t len = std::strlen(line);
    if (len > 0 && line[len-1] != '\n')
      for (int c = getc(); c > 0 /* not 0 nor EOF */ && c != '\n'; c = getc())
        continue;
    return len;
  }
};

struct FileStream final : public AnyStream {
  explicit FileStream(fileptr_t f_) : f(std::move(f_)) {}

  char* gets(char* line, int size) override { return std::fgets(line, size, f.get()); }
  int getc() override { return std::fgetc(f.get()); }

private:
  fileptr_t f;
};

struct MemoryStream final : public AnyStream {
  MemoryStream(const char* start_, size_t size)
    : end(start_ + size), cur(start_) {}

  char* gets(char* line, int size) override {
    --size; // the same as fgets: at most size-1 characters
    if (cur >= end)
      return nullptr;
    if (size > end - cur)
      size = int(end - cur);
    const char* nl = (const char*) std::memchr(cur, '\n', size);
    size_t len = nl ? nl - cur + 1 : size;
    std::memcpy(line, cur, len);
    line[len] = '\0';
    cur += len;
    return line;
  }
  int getc() override { return cur < end ? *cur++ : EOF; }

private:
  const char* const end;
  const char* cur;
};

/// Opens path for reading lines. "-" stands for stdin. Files with
/// the .gz extension are decompressed on the fly (zlib).
ENSFIT_DLL std::unique_ptr<AnyStream> open_line_stream(const std::string& path);

} // namespace ensfit
#endif
