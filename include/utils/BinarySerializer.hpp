/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary stream helpers for grid snapshots.
 * Values are written in native byte order, matching the in-memory grid.
 */
namespace Formicary::BinarySerial {

// Upper bound on element counts accepted by Reader::readVector
constexpr uint32_t MAX_VECTOR_ELEMENTS = 64u * 1024u * 1024u;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  static std::unique_ptr<Writer> createFileWriter(const std::string &filename) {
    auto stream = std::make_shared<std::ofstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SERIAL_ERROR("Failed to create writer for file: " + filename);
      return nullptr;
    }
    return std::make_unique<Writer>(stream);
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    // Readers refuse anything larger, so never write it
    if (vec.size() > MAX_VECTOR_ELEMENTS) {
      SERIAL_ERROR("Vector size too large to write: " +
                   std::to_string(vec.size()) + " elements");
      return false;
    }
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    if (size > 0) {
      m_stream->write(reinterpret_cast<const char *>(vec.data()),
                      static_cast<std::streamsize>(sizeof(T) * size));
    }
    return m_stream->good();
  }

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> createFileReader(const std::string &filename) {
    auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SERIAL_ERROR("Failed to create reader for file: " + filename);
      return nullptr;
    }
    return std::make_unique<Reader>(stream);
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  // Rejects a stored count above maxElements before allocating
  template <typename T>
  bool readVector(std::vector<T> &vec,
                  uint32_t maxElements = MAX_VECTOR_ELEMENTS) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }

    if (size == 0) {
      vec.clear();
      return true;
    }

    if (size > maxElements || size > MAX_VECTOR_ELEMENTS) {
      SERIAL_ERROR("Vector size too large: " + std::to_string(size) +
                   " elements");
      return false;
    }

    vec.resize(size);
    const auto byteCount = static_cast<std::streamsize>(sizeof(T) * size);
    m_stream->read(reinterpret_cast<char *>(vec.data()), byteCount);
    // Reading the last byte of the file may set eof; only a short read fails
    return !m_stream->bad() && m_stream->gcount() == byteCount;
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace Formicary::BinarySerial

#endif // BINARY_SERIALIZER_HPP
