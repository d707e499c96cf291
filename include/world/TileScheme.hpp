/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_SCHEME_HPP
#define TILE_SCHEME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>

namespace Formicary {

// One packed grid cell
using Tile = uint32_t;

/**
 * @brief Named bit-fields packed into every tile.
 *
 * Bit layout (LSB first), bits 24-31 reserved:
 *   entityType  4 bits @ 0
 *   entityId   12 bits @ 4
 *   terrain     2 bits @ 16
 *   homeTrail   3 bits @ 18
 *   foodTrail   3 bits @ 21
 *
 * This layout is shared with anything that reads the raw grid buffer.
 */
enum class TileProp : uint8_t {
    ENTITY_TYPE = 0,
    ENTITY_ID = 1,
    TERRAIN = 2,
    HOME_TRAIL = 3,
    FOOD_TRAIL = 4
};

constexpr size_t TILE_PROP_COUNT = 5;

struct BitField {
    uint8_t length;
    uint8_t offset;
    uint32_t mask;

    constexpr uint32_t maxValue() const { return mask >> offset; }
};

// clang-format off
inline constexpr std::array<BitField, TILE_PROP_COUNT> TILE_BIT_SCHEME{{
    {4,  0,  0b00000000000000000000000000001111u}, // ENTITY_TYPE
    {12, 4,  0b00000000000000001111111111110000u}, // ENTITY_ID
    {2,  16, 0b00000000000000110000000000000000u}, // TERRAIN
    {3,  18, 0b00000000000111000000000000000000u}, // HOME_TRAIL
    {3,  21, 0b00000000111000000000000000000000u}, // FOOD_TRAIL
}};
// clang-format on

constexpr const BitField& bitField(TileProp prop) {
    return TILE_BIT_SCHEME[static_cast<size_t>(prop)];
}

namespace detail {
constexpr bool schemeIsConsistent() {
    uint32_t seen = 0;
    unsigned totalWidth = 0;
    for (const BitField& field : TILE_BIT_SCHEME) {
        const uint32_t expected = ((1u << field.length) - 1u) << field.offset;
        if (field.mask != expected || (seen & field.mask) != 0) {
            return false;
        }
        seen |= field.mask;
        totalWidth += field.length;
    }
    return totalWidth <= 32;
}
} // namespace detail

static_assert(detail::schemeIsConsistent(),
              "Tile bit-fields must match their masks and never overlap");

/**
 * @brief Extract one field from a tile word
 */
constexpr uint32_t getBitValue(Tile tile, TileProp prop) {
    const BitField& field = bitField(prop);
    return (tile & field.mask) >> field.offset;
}

/**
 * @brief Return tile with one field replaced by value
 *
 * value is not range checked. Bits beyond the field's width are shifted
 * into the next field up and corrupt it. Callers that cannot guarantee the
 * range should use BitPackedGrid::setTilePropChecked.
 */
constexpr Tile setBitValue(Tile tile, TileProp prop, uint32_t value) {
    const BitField& field = bitField(prop);
    return (value << field.offset) | (tile & ~field.mask);
}

constexpr bool fitsField(TileProp prop, uint32_t value) {
    return value <= bitField(prop).maxValue();
}

// All fields of one tile, decoded
struct TileFields {
    uint32_t entityType{0};
    uint32_t entityId{0};
    uint32_t terrain{0};
    uint32_t homeTrail{0};
    uint32_t foodTrail{0};
};

constexpr TileFields unpackTile(Tile tile) {
    return TileFields{getBitValue(tile, TileProp::ENTITY_TYPE),
                      getBitValue(tile, TileProp::ENTITY_ID),
                      getBitValue(tile, TileProp::TERRAIN),
                      getBitValue(tile, TileProp::HOME_TRAIL),
                      getBitValue(tile, TileProp::FOOD_TRAIL)};
}

// Stream operator for test output
inline std::ostream& operator<<(std::ostream& os, const TileProp& prop) {
    switch (prop) {
        case TileProp::ENTITY_TYPE: return os << "ENTITY_TYPE";
        case TileProp::ENTITY_ID: return os << "ENTITY_ID";
        case TileProp::TERRAIN: return os << "TERRAIN";
        case TileProp::HOME_TRAIL: return os << "HOME_TRAIL";
        case TileProp::FOOD_TRAIL: return os << "FOOD_TRAIL";
        default: return os << "UNKNOWN";
    }
}

} // namespace Formicary

#endif // TILE_SCHEME_HPP
