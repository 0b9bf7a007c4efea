// Copyright Global Phasing Ltd.

#define ENSFIT_PROG na
#include "options.h"
#include <cstdio>   // for fprintf
#include <cstdlib>  // for strtol, strtod, exit
#include <ensfit/version.hpp>   // for ENSFIT_VERSION

using std::fprintf;

const option::Descriptor CommonUsage[] = {
  { 0, 0, 0, 0, 0, 0 }, // this makes CommonUsage[Help] return Help item, etc
  { Help, 0, "h", "help", Arg::None, "  -h, --help  \tPrint usage and exit." },
  { Version, 0, "V", "version", Arg::None,
    "  -V, --version  \tPrint version and exit." },
  { Verbose, 0, "v", "verbose", Arg::None,
    "  -v, --verbose  \tVerbose output (-vv for debug messages)." },
  { Quiet, 0, "q", "quiet", Arg::None,
    "  -q, --quiet  \tDo not print warnings." }
};

option::ArgStatus Arg::Required(const option::Option& option, bool msg) {
  if (option.arg != nullptr)
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Option '%s' requires an argument\n", option.name);
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::Int(const option::Option& option, bool msg) {
  if (option.arg) {
    char* endptr = nullptr;
    std::strtol(option.arg, &endptr, 10);
    if (endptr != option.arg && *endptr == '\0')
      return option::ARG_OK;
  }
  if (msg)
    fprintf(stderr, "Option '%s' requires an integer argument\n", option.name);
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::Float(const option::Option& option, bool msg) {
  if (option.arg) {
    char* endptr = nullptr;
    std::strtod(option.arg, &endptr);
    if (endptr != option.arg && *endptr == '\0')
      return option::ARG_OK;
  }
  if (msg)
    fprintf(stderr, "Option '%s' requires a numeric argument\n", option.name);
  return option::ARG_ILLEGAL;
}

// we wrap fwrite because passing it directly may cause warning
// "ignoring attributes on template argument" [-Wignored-attributes]
static
size_t write_func(const void *ptr, size_t size, size_t nmemb, FILE *stream) {
  return fwrite(ptr, size, nmemb, stream);
}

void OptParser::simple_parse(int argc, char** argv,
                             const option::Descriptor usage[]) {
  if (argc < 1)
    std::exit(2);
  option::Stats stats(/*reordering*/true, usage, argc-1, argv+1);
  options.resize(stats.options_max);
  buffer.resize(stats.buffer_max);
  parse(usage, argc-1, argv+1, options.data(), buffer.data());
  if (error())
    std::exit(2);
  if (options[Help]) {
    option::printUsage(write_func, stdout, usage);
    std::exit(0);
  }
  if (options[Version]) {
    print_version(program_name, options[Verbose]);
    std::exit(0);
  }
  if (options[NoOp]) {
    fprintf(stderr, "Invalid option.\n");
    option::printUsage(write_func, stderr, usage);
    std::exit(2);
  }
}

int OptParser::integer_or(int opt, int default_) const {
  if (options[opt])
    return std::atoi(options[opt].arg);
  return default_;
}

double OptParser::number_or(int opt, double default_) const {
  if (options[opt])
    return std::strtod(options[opt].arg, nullptr);
  return default_;
}

int OptParser::verbosity_threshold() const {
  if (options[Quiet])
    return 0;
  switch (options[Verbose].count()) {
    case 0: return 3;
    case 1: return 6;
    default: return 8;
  }
}

void OptParser::print_try_help_and_exit(const char* msg) const {
  fprintf(stderr, "%s\nTry '%s --help' for more information.\n",
                  msg, program_name);
  std::exit(2);
}

void OptParser::require_positional_args(int n) {
  if (nonOptionsCount() != n) {
    fprintf(stderr, "%s requires %d arguments but got %d.",
                    program_name, n, nonOptionsCount());
    print_try_help_and_exit("");
  }
}

void OptParser::require_input_files_as_args(int other_args) {
  if (nonOptionsCount() <= other_args)
    print_try_help_and_exit("No input files. Nothing to do.");
}

std::vector<std::string> OptParser::paths_from_args(int other) {
  require_input_files_as_args(other);
  std::vector<std::string> paths;
  for (int i = other; i < nonOptionsCount(); ++i)
    paths.emplace_back(nonOption(i));
  return paths;
}

void print_version(const char* program_name, bool verbose) {
  std::printf("%s " ENSFIT_VERSION "\n", program_name);
  if (verbose) {
#if defined(__clang__)
    std::printf("Compiler: Clang %d.%d.%d (C++ %ld)\n",
                __clang_major__, __clang_minor__, __clang_patchlevel__, __cplusplus);
#elif defined(__GNUC__)
    std::printf("Compiler: GCC %d.%d.%d (C++ %ld)\n",
                __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__, __cplusplus);
#endif
  }
}
