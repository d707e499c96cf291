/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace Formicary {
    /**
     * @brief Process-wide generator for entity identifiers.
     *
     * IDs are only used for logging and diagnostics; entity identity inside
     * the world is the entity's address.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        /**
         * @brief Generates a new unique ID. The first ID is 1.
         */
        static IDType generate() {
            return m_nextID++;
        }

        static constexpr IDType INVALID_ID = 0;

    private:
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace Formicary

#endif // UNIQUE_ID_HPP
