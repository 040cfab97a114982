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

#include <string>
#include <utility>
#include <vector>
#include "object_id.hpp"
#include "registry_runtime.h"
#include "shared_object_registry.h"

namespace arbor {

    /**
     * Anything backed by a registry entry.
     */
    class Object {
    public:
        virtual ~Object() = default;
        virtual ObjectId object_id() const = 0;
    };

    template<class T>
    T* object_cast(Object* obj) {
        return dynamic_cast<T*>(obj);
    }

    template<class T>
    const T* object_cast(const Object* obj) {
        return dynamic_cast<const T*>(obj);
    }

    /**
     * Owning handle to one registry entry. Destroying (or dispose()-ing)
     * the handle destroys the entry and its whole subtree, unless the
     * entry is already gone because an ancestor took it down first.
     *
     * Move-only. A moved-from handle owns nothing.
     *
     * Queries are best-effort: on a dead entry they return empty/invalid
     * values instead of throwing. Structural mutations (set_parent,
     * set_property, raise, lower, stack_under, stack_above) throw
     * ObjectError. set_name is dropped silently.
     */
    class ObjectBase : public Object {
    public:
        template<class T>
        static ObjectBase create(SharedObjectRegistry& registry) {
            return ObjectBase(registry, registry.register_object<T>());
        }

        // Uses the global registry; aborts if it was never initialized
        template<class T>
        static ObjectBase create() {
            return create<T>(global_registry_or_abort());
        }

        ObjectBase(const ObjectBase&) = delete;
        ObjectBase& operator=(const ObjectBase&) = delete;

        ObjectBase(ObjectBase&& other) noexcept;
        ObjectBase& operator=(ObjectBase&& other) noexcept;

        ~ObjectBase() override;

        ObjectId object_id() const override { return id_; }
        ObjectId id() const { return id_; }

        // False after dispose(), after a move, or once an ancestor was destroyed
        bool alive() const;

        std::string name() const;
        void set_name(std::string name);

        ObjectId parent() const;
        void set_parent(ObjectId new_parent);

        std::vector<ObjectId> children() const;
        ObjectId find_child_by_name(const std::string& name) const;

        template<class T>
        void set_property(const std::string& key, T&& value) {
            live_registry().set_dynamic_property(id_, key, std::forward<T>(value));
        }

        // none if the key is absent, holds another type, or the entry is gone
        template<class T>
        boost::optional<T> property(const std::string& key) const {
            if (!registry_) {
                return boost::none;
            }
            const ObjectId id = id_;
            return registry_->with_read([id, &key](const ObjectRegistry& r) -> boost::optional<T> {
                if (!r.contains(id)) {
                    return boost::none;
                }
                const T* value = r.dynamic_property<T>(id, key);
                if (!value) {
                    return boost::none;
                }
                return *value;
            });
        }

        // ========== Z-order ==========

        // Other children of the parent, back to front; empty for roots
        std::vector<ObjectId> siblings() const;
        boost::optional<size_t> sibling_index() const;
        ObjectId next_sibling() const;
        ObjectId previous_sibling() const;

        void raise();
        void lower();
        void stack_under(ObjectId sibling);
        void stack_above(ObjectId sibling);

        void dispose();

    private:
        ObjectBase(SharedObjectRegistry& registry, ObjectId id)
            : registry_(&registry), id_(id) {}

        // Throws InvalidObjectId for a disposed or moved-from handle
        SharedObjectRegistry& live_registry() const;

        SharedObjectRegistry* registry_;
        ObjectId id_;
    };

} // namespace arbor
