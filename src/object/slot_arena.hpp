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

#include <vector>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <boost/optional.hpp>
#include "../config.h"
#include "object_id.hpp"

namespace arbor {

    /**
     * Slot table handing out generational ObjectIds.
     *
     * Removal frees the slot, bumps its generation and pushes the slot onto
     * a LIFO free list, so the next insert reuses the most recently freed
     * slot under a new generation. Lookups with a stale generation miss.
     *
     * Pointers returned by try_get() are invalidated by the next insert().
     * Not thread-safe; SharedObjectRegistry provides the locking.
     */
    template<class T>
    class SlotArena {
    public:
        explicit SlotArena(size_t initial_capacity = config::registry::kInitialCapacity) {
            slots_.reserve(initial_capacity);
        }

        /**
         * Store a value and return its fresh id. Always succeeds unless the
         * 32-bit slot index space is exhausted.
         */
        ObjectId insert(T value) {
            uint32_t index;
            if (!free_slots_.empty()) {
                index = free_slots_.back();
                free_slots_.pop_back();
            } else {
                if (slots_.size() >= config::registry::kMaxCapacity) {
                    throw std::runtime_error("SlotArena: slot index space exhausted");
                }
                index = static_cast<uint32_t>(slots_.size());
                slots_.emplace_back();
            }

            Slot& slot = slots_[index];
            slot.value = std::move(value);
            ++live_count_;
            return ObjectId::from_parts(index, slot.generation);
        }

        /**
         * Try to get a value with generation validation.
         * Returns nullptr if the slot is out of range, free, or reused.
         */
        T* try_get(ObjectId id) {
            Slot* slot = resolve(id);
            return slot ? slot->value.get_ptr() : nullptr;
        }

        const T* try_get(ObjectId id) const {
            const Slot* slot = resolve(id);
            return slot ? slot->value.get_ptr() : nullptr;
        }

        bool contains(ObjectId id) const {
            return resolve(id) != nullptr;
        }

        /**
         * Free the slot behind id. Idempotent: removing a stale or
         * already-removed id returns false and changes nothing.
         */
        bool remove(ObjectId id) {
            Slot* slot = resolve(id);
            if (!slot) {
                return false;
            }
            slot->value = boost::none;
            slot->generation = next_generation(slot->generation);
            free_slots_.push_back(id.slot_index());
            --live_count_;
            return true;
        }

        // Visit every live (id, value) pair in slot order
        template<class Fn>
        void for_each(Fn&& fn) const {
            for (size_t i = 0; i < slots_.size(); ++i) {
                const Slot& slot = slots_[i];
                if (slot.value) {
                    fn(ObjectId::from_parts(static_cast<uint32_t>(i), slot.generation), *slot.value);
                }
            }
        }

        template<class Fn>
        void for_each(Fn&& fn) {
            for (size_t i = 0; i < slots_.size(); ++i) {
                Slot& slot = slots_[i];
                if (slot.value) {
                    fn(ObjectId::from_parts(static_cast<uint32_t>(i), slot.generation), *slot.value);
                }
            }
        }

        size_t size() const { return live_count_; }
        bool empty() const { return live_count_ == 0; }
        size_t capacity() const { return slots_.capacity(); }
        size_t slot_count() const { return slots_.size(); }
        size_t free_slot_count() const { return free_slots_.size(); }

        void reserve(size_t n) { slots_.reserve(n); }

        /**
         * Drop every value. Generations are bumped so ids issued before the
         * clear stay dead.
         */
        void clear() {
            free_slots_.clear();
            free_slots_.reserve(slots_.size());
            // Push in reverse order so pop_back() returns the lowest slot first
            for (size_t i = slots_.size(); i-- > 0; ) {
                Slot& slot = slots_[i];
                if (slot.value) {
                    slot.value = boost::none;
                    slot.generation = next_generation(slot.generation);
                }
                free_slots_.push_back(static_cast<uint32_t>(i));
            }
            live_count_ = 0;
        }

    private:
        struct Slot {
            uint32_t generation = config::registry::kFirstGeneration;
            boost::optional<T> value;
        };

        // Bump with wraparound, never use generation 0
        static uint32_t next_generation(uint32_t generation) {
            uint32_t next = generation + 1;
            return next == 0 ? config::registry::kFirstGeneration : next;
        }

        Slot* resolve(ObjectId id) {
            return const_cast<Slot*>(static_cast<const SlotArena*>(this)->resolve(id));
        }

        const Slot* resolve(ObjectId id) const {
            if (!id.valid()) return nullptr;
            const size_t index = id.slot_index();
            if (index >= slots_.size()) return nullptr;
            const Slot& slot = slots_[index];
            if (!slot.value || slot.generation != id.generation()) return nullptr;
            return &slot;
        }

        std::vector<Slot> slots_;
        std::vector<uint32_t> free_slots_;   // Free slot cache (LIFO)
        size_t live_count_ = 0;
    };

} // namespace arbor
