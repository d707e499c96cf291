/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BIT_PACKED_GRID_HPP
#define BIT_PACKED_GRID_HPP

#include "world/TileScheme.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Formicary {

// Supplied buffer is not exactly width * height * 4 bytes
class SizeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Tile coordinates outside the grid
class TileIndexError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/**
 * @brief Fixed-size row-major grid of packed 32-bit tiles.
 *
 * The buffer is width * height tiles in native byte order and never changes
 * size after construction. Field access follows TILE_BIT_SCHEME.
 */
class BitPackedGrid {
public:
    static constexpr size_t BYTES_PER_TILE = sizeof(Tile);

    BitPackedGrid(int width, int height);

    /**
     * @brief Adopt an existing byte buffer
     * @throws SizeMismatchError unless bytes.size() == width * height * 4
     */
    BitPackedGrid(int width, int height, const std::vector<uint8_t>& bytes);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    size_t getTileCount() const { return m_tiles.size(); }
    size_t getByteLength() const { return m_tiles.size() * BYTES_PER_TILE; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }

    // Raw access. Both throw TileIndexError outside the grid.
    Tile getTileRaw(int x, int y) const;
    void setTileRaw(int x, int y, Tile value);

    uint32_t getTileProp(int x, int y, TileProp prop) const;

    /**
     * @brief Overwrite one field of a tile
     *
     * Performs no range check: a value wider than the field spills into the
     * next field up. See setTilePropChecked for the validating variant.
     */
    void setTileProp(int x, int y, TileProp prop, uint32_t value);

    /**
     * @brief Overwrite one field only if value fits its width
     * @return false (tile untouched) when value is too wide
     */
    bool setTilePropChecked(int x, int y, TileProp prop, uint32_t value);

    TileFields getTile(int x, int y) const;

    const Tile* data() const { return m_tiles.data(); }
    const std::vector<Tile>& tiles() const { return m_tiles; }

    // Copy of the buffer in the interop byte layout
    std::vector<uint8_t> toBytes() const;

private:
    size_t indexOf(int x, int y) const;

    int m_width;
    int m_height;
    std::vector<Tile> m_tiles;
};

} // namespace Formicary

#endif // BIT_PACKED_GRID_HPP
