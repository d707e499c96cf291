/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GridSerializer.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstring>
#include <vector>

namespace Formicary {

namespace {

bool fitsSnapshot(const BitPackedGrid& grid) {
    if (grid.getTileCount() > GridSerializer::MAX_TILES) {
        SERIAL_ERROR("Grid of " + std::to_string(grid.getTileCount()) +
                     " tiles exceeds the snapshot limit of " +
                     std::to_string(GridSerializer::MAX_TILES));
        return false;
    }
    return true;
}

bool writeGrid(BinarySerial::Writer& writer, const BitPackedGrid& grid) {
    return writer.write(GridSerializer::MAGIC) &&
           writer.write(GridSerializer::VERSION) &&
           writer.write(static_cast<int32_t>(grid.getWidth())) &&
           writer.write(static_cast<int32_t>(grid.getHeight())) &&
           writer.writeVector(grid.tiles());
}

std::unique_ptr<BitPackedGrid> readGrid(BinarySerial::Reader& reader) {
    uint32_t magic = 0;
    uint32_t version = 0;
    int32_t width = 0;
    int32_t height = 0;
    if (!reader.read(magic) || !reader.read(version) ||
        !reader.read(width) || !reader.read(height)) {
        SERIAL_ERROR("Truncated grid header");
        return nullptr;
    }

    if (magic != GridSerializer::MAGIC) {
        SERIAL_ERROR("Not a grid snapshot (bad magic)");
        return nullptr;
    }
    if (version != GridSerializer::VERSION) {
        SERIAL_ERROR("Unsupported grid snapshot version " + std::to_string(version));
        return nullptr;
    }
    if (width < 0 || height < 0) {
        SERIAL_ERROR("Invalid grid dimensions " + std::to_string(width) + "x" +
                     std::to_string(height));
        return nullptr;
    }

    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (expected > GridSerializer::MAX_TILES) {
        SERIAL_ERROR("Grid dimensions " + std::to_string(width) + "x" + std::to_string(height) +
                     " exceed the snapshot limit of " +
                     std::to_string(GridSerializer::MAX_TILES) + " tiles");
        return nullptr;
    }

    // A stored count above width * height is refused before allocation
    std::vector<Tile> tiles;
    if (!reader.readVector(tiles, static_cast<uint32_t>(expected))) {
        SERIAL_ERROR("Failed to read grid tiles");
        return nullptr;
    }

    if (tiles.size() != expected) {
        SERIAL_ERROR("Grid snapshot holds " + std::to_string(tiles.size()) +
                     " tiles, expected " + std::to_string(expected));
        return nullptr;
    }

    std::vector<uint8_t> bytes(tiles.size() * BitPackedGrid::BYTES_PER_TILE);
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), tiles.data(), bytes.size());
    }
    return std::make_unique<BitPackedGrid>(width, height, bytes);
}

} // namespace

bool GridSerializer::save(const BitPackedGrid& grid, const std::string& path) {
    if (!fitsSnapshot(grid)) {
        return false;
    }
    auto writer = BinarySerial::Writer::createFileWriter(path);
    if (!writer) {
        return false;
    }

    const bool ok = writeGrid(*writer, grid);
    writer->flush();
    if (!ok || !writer->good()) {
        SERIAL_ERROR("Failed to save grid to file: " + path);
        return false;
    }
    SERIAL_INFO("Saved " + std::to_string(grid.getWidth()) + "x" +
                std::to_string(grid.getHeight()) + " grid to " + path);
    return true;
}

bool GridSerializer::save(const BitPackedGrid& grid, std::shared_ptr<std::ostream> stream) {
    if (!stream || !stream->good()) {
        SERIAL_ERROR("Cannot save grid to an invalid stream");
        return false;
    }
    if (!fitsSnapshot(grid)) {
        return false;
    }
    BinarySerial::Writer writer(stream);
    const bool ok = writeGrid(writer, grid);
    writer.flush();
    return ok && writer.good();
}

std::unique_ptr<BitPackedGrid> GridSerializer::load(const std::string& path) {
    auto reader = BinarySerial::Reader::createFileReader(path);
    if (!reader) {
        return nullptr;
    }

    auto grid = readGrid(*reader);
    if (!grid) {
        SERIAL_ERROR("Failed to load grid from file: " + path);
        return nullptr;
    }
    SERIAL_INFO("Loaded grid from " + path);
    return grid;
}

std::unique_ptr<BitPackedGrid> GridSerializer::load(std::shared_ptr<std::istream> stream) {
    if (!stream || !stream->good()) {
        SERIAL_ERROR("Cannot load grid from an invalid stream");
        return nullptr;
    }
    BinarySerial::Reader reader(stream);
    return readGrid(reader);
}

} // namespace Formicary
