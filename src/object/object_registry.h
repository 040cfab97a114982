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

#include <cstddef>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include <boost/optional.hpp>
#include "../config.h"
#include "object_error.h"
#include "object_id.hpp"
#include "slot_arena.hpp"

namespace arbor {

    /**
     * Identifies the concrete kind of a registered object: a comparable
     * token for typed lookups plus a readable label for diagnostics.
     */
    struct TypeTag {
        std::type_index id;
        std::string name;

        template<class T>
        static TypeTag of() {
            return TypeTag{std::type_index(typeid(T)), boost::core::demangle(typeid(T).name())};
        }
    };

    /**
     * An object's own widget flags, before combining with ancestors.
     */
    struct WidgetState {
        bool visible = true;
        bool enabled = true;

        bool operator==(const WidgetState& o) const {
            return visible == o.visible && enabled == o.enabled;
        }
        bool operator!=(const WidgetState& o) const { return !(*this == o); }
    };

    /**
     * Per-object data held by the registry. External code never sees a
     * record, only its ObjectId.
     */
    struct ObjectRecord {
        explicit ObjectRecord(TypeTag type)
            : type_id(type.id), type_name(std::move(type.name)) {}

        std::string name;
        std::type_index type_id;
        std::string type_name;
        ObjectId parent;                        // invalid() for root objects
        std::vector<ObjectId> children;         // z-order: front() is back-most
        std::unordered_map<std::string, boost::any> properties;
        boost::optional<WidgetState> widget_state;
    };

    /**
     * ObjectRegistry: arena-backed ownership tree.
     *
     * Every object has at most one parent and an ordered list of children.
     * Destroying an object destroys its whole subtree. Reparenting rejects
     * cycles. Operations taking an ObjectId throw ObjectError
     * (InvalidObjectId) when the id does not resolve and leave the registry
     * unchanged.
     *
     * Thread-safety: none. Use SharedObjectRegistry for concurrent access.
     */
    class ObjectRegistry {
    public:
        explicit ObjectRegistry(size_t initial_capacity = config::registry::kInitialCapacity);

        ObjectRegistry(const ObjectRegistry&) = delete;
        ObjectRegistry& operator=(const ObjectRegistry&) = delete;
        ObjectRegistry(ObjectRegistry&&) = default;
        ObjectRegistry& operator=(ObjectRegistry&&) = default;

        // ========== Lifecycle ==========

        /**
         * Register a new unparented, unnamed object of type T.
         */
        template<class T>
        ObjectId register_object() {
            return register_object(TypeTag::of<T>());
        }

        ObjectId register_object(TypeTag type);

        /**
         * Destroy an object and all of its descendants, children before
         * parents. Throws InvalidObjectId without touching anything if id
         * does not resolve.
         */
        void destroy(ObjectId id);

        bool contains(ObjectId id) const { return objects_.contains(id); }

        size_t object_count() const { return objects_.size(); }

        // ========== Tree mutation ==========

        /**
         * Move id under new_parent, appending it as the front-most child.
         * Pass ObjectId::invalid() to make id a root object.
         *
         * @throws ObjectError InvalidObjectId if id or new_parent does not resolve
         * @throws ObjectError CircularParentage if new_parent is id or one of its descendants
         */
        void set_parent(ObjectId id, ObjectId new_parent);

        // Move to the front (end of the parent's children). No-op for roots.
        void raise(ObjectId id);

        // Move to the back (index 0 of the parent's children). No-op for roots.
        void lower(ObjectId id);

        /**
         * Place id directly before (under) / after (above) sibling.
         * Both must share the same parent; anything else, including two
         * root objects, throws InvalidObjectId.
         */
        void stack_under(ObjectId id, ObjectId sibling);
        void stack_above(ObjectId id, ObjectId sibling);

        // ========== Tree queries ==========

        // The parent, or ObjectId::invalid() for a root object
        ObjectId parent(ObjectId id) const;

        const std::vector<ObjectId>& children(ObjectId id) const;

        // Parent first, root last
        std::vector<ObjectId> ancestors(ObjectId id) const;

        /**
         * True if candidate is id or appears on id's parent chain.
         * O(depth).
         */
        bool is_ancestor_of(ObjectId candidate, ObjectId id) const;

        // Other children of id's parent in z-order; empty for roots
        std::vector<ObjectId> siblings(ObjectId id) const;

        // Position in the parent's children; none for roots
        boost::optional<size_t> sibling_index(ObjectId id) const;

        // Neighbours in z-order, or ObjectId::invalid() at either end and for roots
        ObjectId next_sibling(ObjectId id) const;
        ObjectId previous_sibling(ObjectId id) const;

        /**
         * Snapshot traversals of the subtree rooted at root. Each returns
         * root itself as well.
         */
        std::vector<ObjectId> depth_first_preorder(ObjectId root) const;
        std::vector<ObjectId> depth_first_postorder(ObjectId root) const;
        std::vector<ObjectId> breadth_first(ObjectId root) const;

        // Every object without a parent, in slot order
        std::vector<ObjectId> root_objects() const;

        // ========== Naming and lookup ==========

        const std::string& object_name(ObjectId id) const;
        void set_object_name(ObjectId id, std::string name);

        // First direct child named name, or ObjectId::invalid()
        ObjectId find_child_by_name(ObjectId id, const std::string& name) const;

        template<class T>
        ObjectId find_child(ObjectId id, const std::string& name) const {
            return find_child(id, name, std::type_index(typeid(T)));
        }
        ObjectId find_child(ObjectId id, const std::string& name, std::type_index type) const;

        template<class T>
        std::vector<ObjectId> find_children_by_type(ObjectId id) const {
            return find_children_by_type(id, std::type_index(typeid(T)));
        }
        std::vector<ObjectId> find_children_by_type(ObjectId id, std::type_index type) const;

        // All descendants (not id itself) named name, depth-first
        std::vector<ObjectId> find_descendants_by_name(ObjectId id, const std::string& name) const;

        std::type_index type_id(ObjectId id) const;
        const std::string& type_name(ObjectId id) const;

        // ========== Dynamic properties ==========

        /**
         * Store value under key, replacing any previous value whatever its type.
         * C strings (including literals) are stored as std::string, so read
         * them back with dynamic_property<std::string>.
         */
        template<class T>
        void set_dynamic_property(ObjectId id, const std::string& key, T&& value) {
            using Stored = typename std::decay<T>::type;
            if constexpr (std::is_same<Stored, const char*>::value || std::is_same<Stored, char*>::value) {
                record(id).properties[key] = boost::any(std::string(value));
            } else {
                record(id).properties[key] = boost::any(std::forward<T>(value));
            }
        }

        /**
         * Typed read. Returns nullptr both when key is absent and when the
         * stored value is not a T; use property_value() to tell them apart.
         * The pointer is invalidated by the next mutation of this registry.
         */
        template<class T>
        const T* dynamic_property(ObjectId id, const std::string& key) const {
            const boost::any* value = find_property(id, key);
            return value ? boost::any_cast<T>(value) : nullptr;
        }

        /**
         * Strict typed read.
         *
         * @throws ObjectError PropertyNotFound if key is absent
         * @throws ObjectError PropertyTypeMismatch if the stored value is not a T
         */
        template<class T>
        const T& property_value(ObjectId id, const std::string& key) const {
            const boost::any* value = find_property(id, key);
            if (!value) {
                throw ObjectError(ObjectErrc::PropertyNotFound);
            }
            const T* typed = boost::any_cast<T>(value);
            if (!typed) {
                throw ObjectError(ObjectErrc::PropertyTypeMismatch,
                                  boost::core::demangle(typeid(T).name()),
                                  boost::core::demangle(value->type().name()));
            }
            return *typed;
        }

        bool has_dynamic_property(ObjectId id, const std::string& key) const;

        // Returns the removed value, or an empty boost::any if key was absent
        boost::any remove_dynamic_property(ObjectId id, const std::string& key);

        // Sorted property keys
        std::vector<std::string> dynamic_property_names(ObjectId id) const;

        // ========== Widget state ==========

        void init_widget_state(ObjectId id, bool visible = true, bool enabled = true);

        // Setters create the state if absent, other flag defaulting to true
        void set_widget_visible(ObjectId id, bool visible);
        void set_widget_enabled(ObjectId id, bool enabled);

        boost::optional<WidgetState> widget_state(ObjectId id) const;

        // Remove the own state; the object becomes transparent to propagation
        void clear_widget_state(ObjectId id);

        /**
         * Own flag combined with every ancestor that carries widget state.
         * Ancestors without state are skipped. Returns none if id has no
         * widget state of its own.
         */
        boost::optional<bool> is_effectively_visible(ObjectId id) const;
        boost::optional<bool> is_effectively_enabled(ObjectId id) const;

        // ========== Diagnostics ==========

        /**
         * Indented subtree dump, one "[id] name (type)" line per object.
         * For debugging only; the format is not stable.
         */
        std::string dump_object_tree(ObjectId id) const;

    private:
        const ObjectRecord& record(ObjectId id) const;
        ObjectRecord& record(ObjectId id);

        const boost::any* find_property(ObjectId id, const std::string& key) const;

        // Parent's children list, nullptr for roots
        std::vector<ObjectId>* sibling_list(const ObjectRecord& rec);
        const std::vector<ObjectId>* sibling_list(const ObjectRecord& rec) const;

        void detach_from_parent(ObjectId id, const ObjectRecord& rec);
        void restack(ObjectId id, ObjectId sibling, bool above);

        WidgetState& ensure_widget_state(ObjectId id);
        boost::optional<bool> effective_flag(ObjectId id, bool WidgetState::*flag) const;

        SlotArena<ObjectRecord> objects_;
    };

} // namespace arbor
