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

#include "object_base.h"

namespace arbor {

    ObjectBase::ObjectBase(ObjectBase&& other) noexcept
        : registry_(other.registry_), id_(other.id_) {
        other.registry_ = nullptr;
        other.id_ = ObjectId::invalid();
    }

    ObjectBase& ObjectBase::operator=(ObjectBase&& other) noexcept {
        if (this != &other) {
            dispose();
            registry_ = other.registry_;
            id_ = other.id_;
            other.registry_ = nullptr;
            other.id_ = ObjectId::invalid();
        }
        return *this;
    }

    ObjectBase::~ObjectBase() {
        dispose();
    }

    void ObjectBase::dispose() {
        if (registry_ && id_.valid()) {
            registry_->destroy_if_present(id_);
        }
        registry_ = nullptr;
        id_ = ObjectId::invalid();
    }

    bool ObjectBase::alive() const {
        return registry_ && registry_->contains(id_);
    }

    std::string ObjectBase::name() const {
        if (!registry_) {
            return std::string();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.object_name(id) : std::string();
        });
    }

    void ObjectBase::set_name(std::string name) {
        if (!registry_) {
            return;
        }
        const ObjectId id = id_;
        registry_->with_write([id, &name](ObjectRegistry& r) {
            if (r.contains(id)) {
                r.set_object_name(id, std::move(name));
            }
        });
    }

    ObjectId ObjectBase::parent() const {
        if (!registry_) {
            return ObjectId::invalid();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.parent(id) : ObjectId::invalid();
        });
    }

    void ObjectBase::set_parent(ObjectId new_parent) {
        live_registry().set_parent(id_, new_parent);
    }

    std::vector<ObjectId> ObjectBase::children() const {
        if (!registry_) {
            return std::vector<ObjectId>();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.children(id) : std::vector<ObjectId>();
        });
    }

    ObjectId ObjectBase::find_child_by_name(const std::string& name) const {
        if (!registry_) {
            return ObjectId::invalid();
        }
        const ObjectId id = id_;
        return registry_->with_read([id, &name](const ObjectRegistry& r) {
            return r.contains(id) ? r.find_child_by_name(id, name) : ObjectId::invalid();
        });
    }

    std::vector<ObjectId> ObjectBase::siblings() const {
        if (!registry_) {
            return std::vector<ObjectId>();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.siblings(id) : std::vector<ObjectId>();
        });
    }

    boost::optional<size_t> ObjectBase::sibling_index() const {
        if (!registry_) {
            return boost::none;
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) -> boost::optional<size_t> {
            if (!r.contains(id)) {
                return boost::none;
            }
            return r.sibling_index(id);
        });
    }

    ObjectId ObjectBase::next_sibling() const {
        if (!registry_) {
            return ObjectId::invalid();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.next_sibling(id) : ObjectId::invalid();
        });
    }

    ObjectId ObjectBase::previous_sibling() const {
        if (!registry_) {
            return ObjectId::invalid();
        }
        const ObjectId id = id_;
        return registry_->with_read([id](const ObjectRegistry& r) {
            return r.contains(id) ? r.previous_sibling(id) : ObjectId::invalid();
        });
    }

    SharedObjectRegistry& ObjectBase::live_registry() const {
        if (!registry_) {
            throw ObjectError(ObjectErrc::InvalidObjectId);
        }
        return *registry_;
    }

    void ObjectBase::raise() {
        live_registry().raise(id_);
    }

    void ObjectBase::lower() {
        live_registry().lower(id_);
    }

    void ObjectBase::stack_under(ObjectId sibling) {
        live_registry().stack_under(id_, sibling);
    }

    void ObjectBase::stack_above(ObjectId sibling) {
        live_registry().stack_above(id_, sibling);
    }

} // namespace arbor
