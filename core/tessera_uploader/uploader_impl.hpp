// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOADER_IMPL_HPP
#define TESSERA_UPLOADER_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>

#include "uploader_interfaces.hpp"

namespace tessera {
namespace uploader {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool is_regular_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);  // LCOV_EXCL_BR_LINE
  }

  uint64_t file_size(const std::string& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));  // LCOV_EXCL_BR_LINE
  }
};

/**
 * Default implementation of IFileStream using std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  explicit FileStreamImpl(const std::string& path)
      : stream_(path, std::ios::in | std::ios::binary) {}  // LCOV_EXCL_BR_LINE

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset) override {
    stream_.seekg(offset, std::ios::beg);
    return *this;
  }

  std::streamsize gcount() const override {
    return stream_.gcount();
  }

  bool fail() const override {
    return stream_.fail();
  }

  bool is_open() const {
    return stream_.is_open();
  }

private:
  std::ifstream stream_;
};

/**
 * Default implementation of IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> open_for_read(const std::string& path) override {
    auto stream = std::make_unique<FileStreamImpl>(path);
    if (!stream->is_open()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOADER_IMPL_HPP
