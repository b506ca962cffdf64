#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

#include <bufferfile/core/errors.hpp>
#include <bufferfile/report/reporter.hpp>
#include <bufferfile/storage/block_file.hpp>

using namespace bufferfile;

static void print_usage() {
  std::printf(
    "bufferfile-info: block file inspector\n\n"
    "Usage:\n"
    "  bufferfile-info <db_file> [--blocks] [--digest] [--free-chain]\n\n"
    "Options:\n"
    "  --blocks      List every block with its state and id\n"
    "  --digest      Print the sha256 of each payload (implies --blocks)\n"
    "  --free-chain  Walk the free block chain from the header\n"
  );
}

int main(int argc, char** argv) {
  std::string db_file;
  report::ReportOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--blocks") {
      options.list_blocks = true;
    } else if (arg == "--digest") {
      options.digest = true;
    } else if (arg == "--free-chain") {
      options.free_chain = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg.rfind("--", 0) == 0 || !db_file.empty()) {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      print_usage();
      return 1;
    } else {
      db_file = arg;
    }
  }

  if (db_file.empty()) {
    print_usage();
    return 1;
  }

  try {
    storage::BlockFile file(db_file);
    report::report(file, std::cout, options);
  } catch (const core::BlockFileError& ex) {
    std::fprintf(stderr, "Error: %s: %s\n", db_file.c_str(), ex.what());
    return 1;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }
  return 0;
}
