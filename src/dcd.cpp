// Copyright Global Phasing Ltd.

#include <ensfit/dcd.hpp>
#include <algorithm>  // for min
#include <utility>    // for swap
#include <cerrno>
#include <cstring>  // for memcpy, strerror

namespace ensfit {

namespace {

void swap_four_bytes(void* start) {
  char* bytes = static_cast<char*>(start);
  std::swap(bytes[0], bytes[3]);
  std::swap(bytes[1], bytes[2]);
}

size_t file_size(std::FILE* f, const std::string& path) {
  if (std::fseek(f, 0, SEEK_END) != 0)
    sys_fail(path + ": fseek failed");
  long length = std::ftell(f);
  if (length < 0)
    sys_fail(path + ": ftell failed");
  if (std::fseek(f, 0, SEEK_SET) != 0)
    sys_fail(path + ": fseek failed");
  return length;
}

void read_checked(std::FILE* f, void* buf, size_t size, const std::string& path) {
  if (std::fread(buf, size, 1, f) != 1) {
    if (std::ferror(f))
      sys_fail("Failed to read " + path);
    fail("Unexpected end of DCD file: ", path);
  }
}

std::int32_t read_int(std::FILE* f, bool swap, const std::string& path) {
  std::int32_t n;
  read_checked(f, &n, 4, path);
  if (swap)
    swap_four_bytes(&n);
  return n;
}

void expect_marker(std::FILE* f, bool swap, std::int32_t expected,
                   const std::string& path, const char* what) {
  std::int32_t n = read_int(f, swap, path);
  if (n != expected)
    fail("Corrupted DCD file ", path, ": unexpected record length at ", what);
}

std::string strip_title(const char* s, size_t len) {
  while (len > 0 && (s[len-1] == ' ' || s[len-1] == '\0'))
    --len;
  return std::string(s, len);
}

} // anonymous namespace

DcdHeader read_dcd_header(std::FILE* f, const std::string& path) {
  DcdHeader h;
  size_t total_size = file_size(f, path);
  std::int32_t first;
  read_checked(f, &first, 4, path);
  if (first != 84) {
    swap_four_bytes(&first);
    if (first != 84)
      fail("Not a DCD file (or unsupported 64-bit record markers): ", path);
    h.swap_bytes = true;
  }
  char magic[4];
  read_checked(f, magic, 4, path);
  if (std::memcmp(magic, "CORD", 4) != 0)
    fail("Not a coordinate DCD file: ", path);
  std::int32_t icntrl[20];
  read_checked(f, icntrl, sizeof(icntrl), path);
  if (h.swap_bytes)
    for (std::int32_t& n : icntrl)
      swap_four_bytes(&n);
  h.nset = icntrl[0];
  h.istart = icntrl[1];
  h.nsavc = icntrl[2];
  h.charmm_version = icntrl[19];
  if (icntrl[8] != 0)
    fail("DCD files with fixed atoms are not supported: ", path);
  if (h.charmm_version != 0) {
    std::memcpy(&h.delta, &icntrl[9], 4);
    h.has_unit_cell = icntrl[10] != 0;
    if (icntrl[11] != 0)
      fail("DCD files with 4D coordinates are not supported: ", path);
  }
  expect_marker(f, h.swap_bytes, 84, path, "header");

  std::int32_t title_len = read_int(f, h.swap_bytes, path);
  std::int32_t ntitle = read_int(f, h.swap_bytes, path);
  if (ntitle < 0 || title_len != 4 + 80 * ntitle)
    fail("Corrupted DCD file ", path, ": bad title record");
  std::vector<char> title(80 * ntitle);
  if (!title.empty())
    read_checked(f, title.data(), title.size(), path);
  for (std::int32_t i = 0; i < ntitle; ++i)
    h.titles.push_back(strip_title(title.data() + 80 * i, 80));
  expect_marker(f, h.swap_bytes, title_len, path, "title");

  expect_marker(f, h.swap_bytes, 4, path, "atom count");
  std::int32_t natoms = read_int(f, h.swap_bytes, path);
  if (natoms <= 0)
    fail("DCD file ", path, " has no atoms");
  h.n_atoms = natoms;
  expect_marker(f, h.swap_bytes, 4, path, "atom count");

  h.header_size = std::ftell(f);
  h.frame_size = (h.has_unit_cell ? 56 : 0) + 3 * (8 + 4 * (long) h.n_atoms);
  h.n_frames = (total_size - h.header_size) / h.frame_size;
  return h;
}

DcdFile::DcdFile(const std::string& path) : path_(path), file_(nullptr, needs_fclose{true}) {
  fileptr_t f = file_open(path.c_str(), "rb");
  header_ = read_dcd_header(f.get(), path);
}

void DcdFile::open() {
  if (!file_)
    file_ = file_open(path_.c_str(), "rb");
}

void DcdFile::read_frame(size_t index, Frame& frame) {
  if (!file_)
    fail("DcdFile ", path_, ": read_frame() on closed file");
  if (index >= header_.n_frames)
    throw std::out_of_range("DCD file " + path_ + " has no frame #" +
                            std::to_string(index));
  std::FILE* f = file_.get();
  long offset = header_.header_size + (long) index * header_.frame_size;
  if (std::fseek(f, offset, SEEK_SET) != 0)
    sys_fail(path_ + ": fseek failed");
  if (header_.has_unit_cell)
    if (std::fseek(f, 56, SEEK_CUR) != 0)
      sys_fail(path_ + ": fseek failed");
  size_t n = header_.n_atoms;
  std::int32_t rec_len = (std::int32_t) (4 * n);
  buf_.resize(n);
  frame.pos.resize(n);
  for (int axis = 0; axis < 3; ++axis) {
    expect_marker(f, header_.swap_bytes, rec_len, path_, "coordinates");
    read_checked(f, buf_.data(), 4 * n, path_);
    expect_marker(f, header_.swap_bytes, rec_len, path_, "coordinates");
    if (header_.swap_bytes)
      for (float& x : buf_)
        swap_four_bytes(&x);
    for (size_t i = 0; i != n; ++i)
      frame.pos[i].at(axis) = buf_[i];
  }
  frame.label.clear();
}


DcdWriter::DcdWriter(const std::string& path, size_t n_atoms, const std::string& title)
    : path_(path), n_atoms_(n_atoms), file_(nullptr, needs_fclose{true}) {
  std::FILE* f = std::fopen(path.c_str(), "wb");
  if (!f)
    throw IOWriteError(path, "Failed to open " + path + " for writing: " +
                             std::strerror(errno));
  file_.reset(f);
  std::int32_t icntrl[20] = {0};
  icntrl[2] = 1;    // NSAVC
  icntrl[19] = 24;  // pretend to be CHARMM 24
  write_int(84);
  write_bytes("CORD", 4);
  write_bytes(icntrl, sizeof(icntrl));
  write_int(84);
  char title_buf[80];
  std::memset(title_buf, ' ', sizeof(title_buf));
  std::memcpy(title_buf, title.c_str(), std::min(title.size(), sizeof(title_buf)));
  write_int(4 + 80);
  write_int(1);
  write_bytes(title_buf, 80);
  write_int(4 + 80);
  write_int(4);
  write_int((std::int32_t) n_atoms);
  write_int(4);
}

DcdWriter::~DcdWriter() {
  // without close() NSET stays 0; readers use the file size anyway
  file_.reset();
}

void DcdWriter::write_bytes(const void* data, size_t size) {
  if (!file_)
    throw IOWriteError(path_, "Writing to closed file " + path_);
  if (std::fwrite(data, size, 1, file_.get()) != 1)
    throw IOWriteError(path_, "Failed to write " + path_ + ": " + std::strerror(errno));
}

void DcdWriter::write_frame(const Frame& frame) {
  check_same_size(frame.size(), n_atoms_, "DcdWriter::write_frame()");
  std::int32_t rec_len = (std::int32_t) (4 * n_atoms_);
  buf_.resize(n_atoms_);
  for (int axis = 0; axis < 3; ++axis) {
    for (size_t i = 0; i != n_atoms_; ++i)
      buf_[i] = (float) frame[i].at(axis);
    write_int(rec_len);
    write_bytes(buf_.data(), 4 * n_atoms_);
    write_int(rec_len);
  }
  ++written_;
}

void DcdWriter::close() {
  if (!file_)
    return;
  std::int32_t nset = (std::int32_t) written_;
  // NSET follows the record marker and "CORD"
  if (std::fseek(file_.get(), 8, SEEK_SET) != 0)
    throw IOWriteError(path_, "fseek failed on " + path_);
  write_bytes(&nset, 4);
  std::FILE* f = file_.release();
  if (std::fclose(f) != 0)
    throw IOWriteError(path_, "Failed to close " + path_ + ": " + std::strerror(errno));
}

std::string write_dcd(const std::vector<Frame>& frames, const std::string& path) {
  if (frames.empty())
    throw IOWriteError(path, "No frames to write to " + path);
  DcdWriter writer(path, frames[0].size());
  for (const Frame& frame : frames)
    writer.write_frame(frame);
  writer.close();
  return path;
}

} // namespace ensfit
