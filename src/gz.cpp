// Copyright Global Phasing Ltd.
//
// open_line_stream(): plain files, stdin and gzipped files (zlib).

#include <ensfit/input.hpp>
#include <ensfit/util.hpp>  // for iends_with
#include <zlib.h>

namespace ensfit {

namespace {

struct GzStream final : public AnyStream {
  explicit GzStream(gzFile f_) : f(f_) {}
  ~GzStream() {
#if ZLIB_VERNUM >= 0x1235
    gzclose_r(f);
#else
    gzclose(f);
#endif
  }
  GzStream(const GzStream&) = delete;
  GzStream& operator=(const GzStream&) = delete;

  char* gets(char* line, int size) override { return gzgets(f, line, size); }
  int getc() override { return gzgetc(f); }

private:
  gzFile f;
};

} // anonymous namespace

std::unique_ptr<AnyStream> open_line_stream(const std::string& path) {
  if (path == "-")
    return std::unique_ptr<AnyStream>(new FileStream(fileptr_t(stdin, needs_fclose{false})));
  if (iends_with(path, ".gz")) {
    gzFile f = gzopen(path.c_str(), "rb");
    if (!f)
      sys_fail("Failed to gzopen " + path);
#if ZLIB_VERNUM >= 0x1235
    gzbuffer(f, 64*1024);
#endif
    return std::unique_ptr<AnyStream>(new GzStream(f));
  }
  return std::unique_ptr<AnyStream>(new FileStream(file_open(path.c_str(), "rb")));
}

} // namespace ensfit
