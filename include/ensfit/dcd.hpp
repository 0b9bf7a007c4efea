// Copyright Global Phasing Ltd.
//
// Reading and writing CHARMM/NAMD DCD trajectory files.
//
// A DCD file is a sequence of Fortran unformatted records (each record
// is enclosed by its length as 32-bit integer):
//   84 bytes: "CORD" and 20 integers (NSET, ISTART, NSAVC, ..., DELTA as
//             float in the 10th, unit cell flag in the 11th, CHARMM version
//             in the 20th),
//   titles:   count and count*80 characters,
//   4 bytes:  number of atoms,
// then for each frame: optional unit cell (6 doubles) and X, Y and Z
// (each N 4-byte floats). Byte order is detected from the first record.

#ifndef ENSFIT_DCD_HPP_
#define ENSFIT_DCD_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include "input.hpp"       // for fileptr_t
#include "trajectory.hpp"  // for FrameSource

namespace ensfit {

struct DcdHeader {
  size_t n_atoms = 0;
  size_t n_frames = 0;      // from file size, not from NSET
  int nset = 0;             // as written in the file
  int istart = 0;
  int nsavc = 1;
  float delta = 0.f;        // time step
  bool has_unit_cell = false;
  bool swap_bytes = false;
  int charmm_version = 0;
  std::vector<std::string> titles;
  long header_size = 0;     // offset of the first frame
  long frame_size = 0;
};

/// Reads the header. Throws std::runtime_error on unsupported or broken files.
ENSFIT_DLL DcdHeader read_dcd_header(std::FILE* f, const std::string& path);

/// DCD file as a trajectory segment. The header is read in the constructor,
/// the file is kept open only between open() and close().
class ENSFIT_DLL DcdFile : public FrameSource {
public:
  explicit DcdFile(const std::string& path);

  std::string name() const override { return path_; }
  size_t n_atoms() const override { return header_.n_atoms; }
  size_t n_frames() const override { return header_.n_frames; }
  void open() override;
  void close() override { file_.reset(); }
  bool is_open() const override { return (bool) file_; }
  void read_frame(size_t index, Frame& frame) override;

  const std::string& path() const { return path_; }
  const DcdHeader& header() const { return header_; }

private:
  std::string path_;
  DcdHeader header_;
  fileptr_t file_;
  std::vector<float> buf_;
};

/// Writes frames to a new DCD file (native byte order, no unit cell).
/// NSET in the header is updated by close(). Errors throw IOWriteError.
class ENSFIT_DLL DcdWriter {
public:
  DcdWriter(const std::string& path, size_t n_atoms,
            const std::string& title="Created by ensfit");
  ~DcdWriter();
  DcdWriter(const DcdWriter&) = delete;
  DcdWriter& operator=(const DcdWriter&) = delete;

  void write_frame(const Frame& frame);
  /// Updates the frame count in the header and closes the file.
  void close();
  size_t written() const { return written_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  size_t n_atoms_;
  size_t written_ = 0;
  fileptr_t file_;
  std::vector<float> buf_;

  void write_bytes(const void* data, size_t size);
  void write_int(std::int32_t n) { write_bytes(&n, 4); }
};

/// Writes frames to a new DCD file, returns the path.
ENSFIT_DLL std::string write_dcd(const std::vector<Frame>& frames,
                                 const std::string& path);

} // namespace ensfit
#endif
