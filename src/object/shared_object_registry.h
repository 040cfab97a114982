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

#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "object_registry.h"

namespace arbor {

    /**
     * Thread-safe ObjectRegistry wrapper:
     * 1. Queries run concurrently under a shared lock
     * 2. Mutations are serialised under the exclusive lock for their full duration
     * 3. with_read()/with_write() run multi-step logic atomically
     *
     * Queries return copies so nothing escapes the lock. Errors propagate
     * exactly as ObjectRegistry throws them.
     */
    class SharedObjectRegistry {
    public:
        explicit SharedObjectRegistry(size_t initial_capacity = config::registry::kInitialCapacity)
            : registry_(initial_capacity) {}

        SharedObjectRegistry(const SharedObjectRegistry&) = delete;
        SharedObjectRegistry& operator=(const SharedObjectRegistry&) = delete;

        // ========== Escape hatches ==========

        /**
         * Run fn(const ObjectRegistry&) under the shared lock.
         */
        template<class Fn>
        auto with_read(Fn&& fn) const -> decltype(fn(std::declval<const ObjectRegistry&>())) {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return fn(static_cast<const ObjectRegistry&>(registry_));
        }

        /**
         * Run fn(ObjectRegistry&) under the exclusive lock.
         */
        template<class Fn>
        auto with_write(Fn&& fn) -> decltype(fn(std::declval<ObjectRegistry&>())) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return fn(registry_);
        }

        // ========== Lifecycle ==========

        template<class T>
        ObjectId register_object() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return registry_.register_object<T>();
        }

        ObjectId register_object(TypeTag type);
        void destroy(ObjectId id);

        /**
         * Destroy id if it is still registered. Returns false instead of
         * throwing when id was already removed, e.g. by a cascade.
         */
        bool destroy_if_present(ObjectId id);

        bool contains(ObjectId id) const;
        size_t object_count() const;

        // ========== Tree mutation ==========

        void set_parent(ObjectId id, ObjectId new_parent);
        void raise(ObjectId id);
        void lower(ObjectId id);
        void stack_under(ObjectId id, ObjectId sibling);
        void stack_above(ObjectId id, ObjectId sibling);

        // ========== Tree queries ==========

        ObjectId parent(ObjectId id) const;
        std::vector<ObjectId> children(ObjectId id) const;
        std::vector<ObjectId> ancestors(ObjectId id) const;
        bool is_ancestor_of(ObjectId candidate, ObjectId id) const;
        std::vector<ObjectId> siblings(ObjectId id) const;
        boost::optional<size_t> sibling_index(ObjectId id) const;
        ObjectId next_sibling(ObjectId id) const;
        ObjectId previous_sibling(ObjectId id) const;
        std::vector<ObjectId> depth_first_preorder(ObjectId root) const;
        std::vector<ObjectId> depth_first_postorder(ObjectId root) const;
        std::vector<ObjectId> breadth_first(ObjectId root) const;
        std::vector<ObjectId> root_objects() const;

        // ========== Naming and lookup ==========

        std::string object_name(ObjectId id) const;
        void set_object_name(ObjectId id, std::string name);
        ObjectId find_child_by_name(ObjectId id, const std::string& name) const;

        template<class T>
        ObjectId find_child(ObjectId id, const std::string& name) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return registry_.find_child<T>(id, name);
        }

        template<class T>
        std::vector<ObjectId> find_children_by_type(ObjectId id) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return registry_.find_children_by_type<T>(id);
        }

        std::vector<ObjectId> find_descendants_by_name(ObjectId id, const std::string& name) const;

        std::type_index type_id(ObjectId id) const;
        std::string type_name(ObjectId id) const;

        // ========== Dynamic properties ==========

        template<class T>
        void set_dynamic_property(ObjectId id, const std::string& key, T&& value) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            registry_.set_dynamic_property(id, key, std::forward<T>(value));
        }

        /**
         * Copy of the stored value; none if absent or not a T.
         */
        template<class T>
        boost::optional<T> dynamic_property(ObjectId id, const std::string& key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            const T* value = registry_.dynamic_property<T>(id, key);
            if (!value) {
                return boost::none;
            }
            return *value;
        }

        template<class T>
        T property_value(ObjectId id, const std::string& key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return registry_.property_value<T>(id, key);
        }

        bool has_dynamic_property(ObjectId id, const std::string& key) const;
        boost::any remove_dynamic_property(ObjectId id, const std::string& key);
        std::vector<std::string> dynamic_property_names(ObjectId id) const;

        // ========== Widget state ==========

        void init_widget_state(ObjectId id, bool visible = true, bool enabled = true);
        void set_widget_visible(ObjectId id, bool visible);
        void set_widget_enabled(ObjectId id, bool enabled);
        void clear_widget_state(ObjectId id);
        boost::optional<WidgetState> widget_state(ObjectId id) const;
        boost::optional<bool> is_effectively_visible(ObjectId id) const;
        boost::optional<bool> is_effectively_enabled(ObjectId id) const;

        // ========== Diagnostics ==========

        std::string dump_object_tree(ObjectId id) const;

    private:
        mutable std::shared_mutex mutex_;
        ObjectRegistry registry_;
    };

} // namespace arbor
