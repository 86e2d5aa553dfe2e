// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOADER_INTERFACES_HPP
#define TESSERA_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <ios>
#include <memory>
#include <string>

namespace tessera {
namespace uploader {

/**
 * Filesystem queries the engine needs about a source file
 * Allows mocking the local file for testing
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Check if a path exists and refers to a regular file
   */
  virtual bool is_regular_file(const std::string& path) const = 0;

  /**
   * Get the size of a file in bytes
   * @throws std::exception if the size cannot be determined
   */
  virtual uint64_t file_size(const std::string& path) const = 0;
};

/**
 * Read-only stream over a source file
 * Each part upload opens its own stream, so implementations need no locking
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  /**
   * Read data from the file stream
   * @param buffer Buffer to read into
   * @param size Number of bytes to read
   * @return Reference to this stream for chaining
   */
  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  /**
   * Seek to an absolute offset
   */
  virtual IFileStream& seekg(std::streamoff offset) = 0;

  /**
   * Number of characters read in the last read operation
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool fail() const = 0;
};

/**
 * Factory interface for opening source file streams
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * Open a file for binary reading
   * @param path Path to the file
   * @return Unique pointer to the file stream, or nullptr on failure
   */
  virtual std::unique_ptr<IFileStream> open_for_read(const std::string& path) = 0;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOADER_INTERFACES_HPP
