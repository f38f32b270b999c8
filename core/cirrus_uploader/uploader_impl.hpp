// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_IMPL_HPP
#define CIRRUS_UPLOADER_IMPL_HPP

#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <string>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * IByteSource over any std::istream (stdin, string streams, ...)
 */
class StreamByteSource : public IByteSource {
public:
  explicit StreamByteSource(std::istream& stream)
      : stream_(stream) {}

  ReadResult read(char* buffer, size_t size) override {
    if (size == 0 || stream_.eof()) {
      return ReadResult::Data(0);
    }
    stream_.read(buffer, static_cast<std::streamsize>(size));
    if (stream_.bad()) {
      return ReadResult::Error("stream read failed");
    }
    // failbit alone means a short read at end of stream
    return ReadResult::Data(static_cast<size_t>(stream_.gcount()));
  }

private:
  std::istream& stream_;
};

/**
 * IByteSource reading a local file
 */
class FileByteSource : public IByteSource {
public:
  explicit FileByteSource(const std::string& path)
      : path_(path)
      , file_(path, std::ios::binary)
      , open_errno_(file_.is_open() ? 0 : errno) {}  // LCOV_EXCL_BR_LINE

  bool isOpen() const { return file_.is_open(); }

  const std::string& path() const { return path_; }

  ReadResult read(char* buffer, size_t size) override {
    if (!file_.is_open()) {
      std::string reason = open_errno_ != 0 ? std::strerror(open_errno_) : "cannot open";
      return ReadResult::Error("Cannot open local file: " + path_ + " (" + reason + ")");
    }
    if (size == 0 || file_.eof()) {
      return ReadResult::Data(0);
    }
    file_.read(buffer, static_cast<std::streamsize>(size));
    if (file_.bad()) {
      return ReadResult::Error("Read failed: " + path_);
    }
    return ReadResult::Data(static_cast<size_t>(file_.gcount()));
  }

private:
  std::string path_;
  std::ifstream file_;
  int open_errno_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_IMPL_HPP
