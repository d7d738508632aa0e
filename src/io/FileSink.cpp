/* @file FileSink.cpp
 * @brief write-then-rename status file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdio>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Carpark headers
#include "io/FileSink.hpp"

using namespace carpark::io;

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

bool FileSink::render(const std::string& text, std::chrono::milliseconds) {
  // local FS write; the fan-out worker still checks the elapsed time
  const std::string tmp = path_ + ".tmp";

  FILE* fp = std::fopen(tmp.c_str(), "w");
  if (!fp) {
    std::cerr << "[FileSink] open " << tmp << ": " << strerror(errno) << "\n";
    return false;
  }

  const std::string out = text + "\n";
  const bool written = std::fwrite(out.data(), 1, out.size(), fp) == out.size();
  const bool closed = std::fclose(fp) == 0;
  if (!written || !closed) {
    std::cerr << "[FileSink] write " << tmp << ": " << strerror(errno) << "\n";
    std::remove(tmp.c_str());
    return false;
  }

  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    std::cerr << "[FileSink] rename " << tmp << ": " << strerror(errno) << "\n";
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}
