/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/BitPackedGrid.hpp"
#include "core/Logger.hpp"
#include <cstring>

namespace Formicary {

namespace {
size_t checkedTileCount(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Grid dimensions must not be negative: " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<size_t>(width) * static_cast<size_t>(height);
}
} // namespace

BitPackedGrid::BitPackedGrid(int width, int height)
    : m_width(width), m_height(height), m_tiles(checkedTileCount(width, height), 0u) {}

BitPackedGrid::BitPackedGrid(int width, int height, const std::vector<uint8_t>& bytes)
    : m_width(width), m_height(height) {
    const size_t tileCount = checkedTileCount(width, height);
    const size_t expected = tileCount * BYTES_PER_TILE;
    if (bytes.size() != expected) {
        GRID_ERROR("Provided buffer is " + std::to_string(bytes.size()) +
                   " bytes, expected " + std::to_string(expected));
        throw SizeMismatchError("Provided buffer is not the right size: got " +
                                std::to_string(bytes.size()) + " bytes, expected " +
                                std::to_string(expected));
    }
    m_tiles.resize(tileCount);
    if (expected > 0) {
        std::memcpy(m_tiles.data(), bytes.data(), expected);
    }
}

size_t BitPackedGrid::indexOf(int x, int y) const {
    if (!inBounds(x, y)) {
        throw TileIndexError("Tile (" + std::to_string(x) + ", " + std::to_string(y) +
                             ") is outside " + std::to_string(m_width) + "x" +
                             std::to_string(m_height) + " grid");
    }
    return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
}

Tile BitPackedGrid::getTileRaw(int x, int y) const {
    return m_tiles[indexOf(x, y)];
}

void BitPackedGrid::setTileRaw(int x, int y, Tile value) {
    m_tiles[indexOf(x, y)] = value;
}

uint32_t BitPackedGrid::getTileProp(int x, int y, TileProp prop) const {
    return getBitValue(getTileRaw(x, y), prop);
}

void BitPackedGrid::setTileProp(int x, int y, TileProp prop, uint32_t value) {
    Tile& tile = m_tiles[indexOf(x, y)];
    tile = setBitValue(tile, prop, value);
}

bool BitPackedGrid::setTilePropChecked(int x, int y, TileProp prop, uint32_t value) {
    if (!fitsField(prop, value)) {
        GRID_WARN("Value " + std::to_string(value) + " does not fit field " +
                  std::to_string(static_cast<int>(prop)) + " (max " +
                  std::to_string(bitField(prop).maxValue()) + ")");
        return false;
    }
    setTileProp(x, y, prop, value);
    return true;
}

TileFields BitPackedGrid::getTile(int x, int y) const {
    return unpackTile(getTileRaw(x, y));
}

std::vector<uint8_t> BitPackedGrid::toBytes() const {
    std::vector<uint8_t> bytes(getByteLength());
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), m_tiles.data(), bytes.size());
    }
    return bytes;
}

} // namespace Formicary
