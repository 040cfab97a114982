/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */
#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace arbor {

    /**
     * ObjectId is a compact identifier for objects in the ObjectRegistry.
     * It encodes the arena slot index and a generation to prevent ABA issues.
     *
     * The slot index is a 32-bit value and the generation is a 32-bit value
     * bumped every time the slot is freed. A stale ObjectId whose slot was
     * reused never resolves to the newer occupant.
     *
     * Layout: [63:32] slot index, [31:0] generation
     */
    class alignas(8) ObjectId {
    public:
        static constexpr uint64_t INVALID_RAW = ~uint64_t{0};

        constexpr ObjectId() : v_(INVALID_RAW) {}

        // Factory method to create ObjectId from raw value
        static constexpr ObjectId from_raw(uint64_t v) {
            return ObjectId(v);
        }

        // Factory method to create invalid ObjectId
        static constexpr ObjectId invalid() {
            return ObjectId(INVALID_RAW);
        }

        // Factory method from slot index and generation
        static constexpr ObjectId from_parts(uint32_t slot_index, uint32_t generation) {
            return ObjectId((uint64_t(slot_index) << 32) | generation);
        }

        constexpr uint64_t raw() const {
            return v_;
        }

        constexpr uint32_t slot_index() const {
            return uint32_t(v_ >> 32);
        }

        /**
         * Accessor for generation - Returns the low 32 bits of the raw value
         *
         * Arena slots start at generation 1 and never hand out 0, so a
         * zero-generation handle is never live.
         */
        constexpr uint32_t generation() const {
            return uint32_t(v_ & 0xFFFFFFFFu);
        }

        /**
         * True unless this is the invalid() sentinel. Says nothing about
         * whether the object is still alive; only a registry lookup does.
         */
        constexpr bool valid() const {
            return v_ != INVALID_RAW;
        }

        constexpr bool operator==(const ObjectId& o) const {
            return v_ == o.v_;
        }

        constexpr bool operator!=(const ObjectId& o) const {
            return v_ != o.v_;
        }

        constexpr bool operator<(const ObjectId& o) const {
            return v_ < o.v_;
        }

    private:
        explicit constexpr ObjectId(uint64_t v) : v_(v) {}

        uint64_t v_;
    }; // ObjectId

    static_assert(alignof(ObjectId) == 8, "ObjectId must be 8-byte aligned");
    static_assert(sizeof(ObjectId) == 8, "ObjectId must be exactly 8 bytes");

    // Debug form: ObjectId(<slot>v<generation>), or ObjectId(invalid)
    inline std::string to_string(ObjectId id) {
        if (!id.valid()) {
            return "ObjectId(invalid)";
        }
        return "ObjectId(" + std::to_string(id.slot_index()) + "v" +
               std::to_string(id.generation()) + ")";
    }

    inline std::ostream& operator<<(std::ostream& os, ObjectId id) {
        return os << to_string(id);
    }

} // namespace arbor

namespace std {
    template<>
    struct hash<arbor::ObjectId> {
        size_t operator()(const arbor::ObjectId& id) const noexcept {
            return std::hash<uint64_t>()(id.raw());
        }
    };
}
