// Copyright Global Phasing Ltd.

// Thin, leaky wrapper around The Lean Mean C++ Option Parser.

#pragma once

#include <vector>
#include <string>
#include <optionparser.h>

#ifndef ENSFIT_PROG
# error "define ENSFIT_PROG before including options.h"
#endif

#define ENSFIT_XSTRINGIZE(s) ENSFIT_STRINGIZE(s)
#define ENSFIT_STRINGIZE(s) #s
#define ENSFIT_XCONCAT(a, b) ENSFIT_CONCAT(a, b)
#define ENSFIT_CONCAT(a, b) a##b
#define ENSFIT_MAIN ENSFIT_XCONCAT(ENSFIT_PROG, _main)
#define EXE_NAME "ensfit " ENSFIT_XSTRINGIZE(ENSFIT_PROG)

enum { NoOp=0, Help=1, Version=2, Verbose=3, Quiet=4 };

extern const option::Descriptor CommonUsage[];

struct Arg: public option::Arg {
  static option::ArgStatus Required(const option::Option& option, bool msg);
  static option::ArgStatus Int(const option::Option& option, bool msg);
  static option::ArgStatus Float(const option::Option& option, bool msg);
};

struct OptParser : option::Parser {
  const char* program_name;
  std::vector<option::Option> options;
  std::vector<option::Option> buffer;

  explicit OptParser(const char* prog) : program_name(prog) {}
  void simple_parse(int argc, char** argv, const option::Descriptor usage[]);
  void require_positional_args(int n);
  void require_input_files_as_args(int other_args=0);
  std::vector<std::string> paths_from_args(int other=0);
  [[noreturn]] void print_try_help_and_exit(const char* msg) const;
  int integer_or(int opt, int default_) const;
  double number_or(int opt, double default_) const;
  // 8=debug with -vv, 6 with -v, 3 (warnings only) by default, 0 with -q
  int verbosity_threshold() const;
};

void print_version(const char* program_name, bool verbose=false);
