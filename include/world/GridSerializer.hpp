/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_SERIALIZER_HPP
#define GRID_SERIALIZER_HPP

#include "utils/BinarySerializer.hpp"
#include "world/BitPackedGrid.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace Formicary {

/**
 * @brief Saves and loads grid snapshots.
 *
 * File layout (native byte order):
 *   uint32 magic 'FGRD', uint32 version, int32 width, int32 height,
 *   uint32 tileCount, tileCount * uint32 tiles
 *
 * Failures are logged and reported through the return value.
 */
class GridSerializer {
public:
    static constexpr uint32_t MAGIC = 0x44524746u; // "FGRD" read as little-endian
    static constexpr uint32_t VERSION = 1;
    // Largest grid that can be saved and read back
    static constexpr size_t MAX_TILES = BinarySerial::MAX_VECTOR_ELEMENTS;

    // false for grids above MAX_TILES; nothing is written in that case
    static bool save(const BitPackedGrid& grid, const std::string& path);
    static bool save(const BitPackedGrid& grid, std::shared_ptr<std::ostream> stream);

    // nullptr on I/O error, bad header, or tile count mismatch
    static std::unique_ptr<BitPackedGrid> load(const std::string& path);
    static std::unique_ptr<BitPackedGrid> load(std::shared_ptr<std::istream> stream);
};

} // namespace Formicary

#endif // GRID_SERIALIZER_HPP
