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

#include "shared_object_registry.h"

namespace arbor {

    using ReadLock = std::shared_lock<std::shared_mutex>;
    using WriteLock = std::unique_lock<std::shared_mutex>;

    ObjectId SharedObjectRegistry::register_object(TypeTag type) {
        WriteLock lock(mutex_);
        return registry_.register_object(std::move(type));
    }

    void SharedObjectRegistry::destroy(ObjectId id) {
        WriteLock lock(mutex_);
        registry_.destroy(id);
    }

    bool SharedObjectRegistry::destroy_if_present(ObjectId id) {
        WriteLock lock(mutex_);
        if (!registry_.contains(id)) {
            return false;
        }
        registry_.destroy(id);
        return true;
    }

    bool SharedObjectRegistry::contains(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.contains(id);
    }

    size_t SharedObjectRegistry::object_count() const {
        ReadLock lock(mutex_);
        return registry_.object_count();
    }

    void SharedObjectRegistry::set_parent(ObjectId id, ObjectId new_parent) {
        WriteLock lock(mutex_);
        registry_.set_parent(id, new_parent);
    }

    void SharedObjectRegistry::raise(ObjectId id) {
        WriteLock lock(mutex_);
        registry_.raise(id);
    }

    void SharedObjectRegistry::lower(ObjectId id) {
        WriteLock lock(mutex_);
        registry_.lower(id);
    }

    void SharedObjectRegistry::stack_under(ObjectId id, ObjectId sibling) {
        WriteLock lock(mutex_);
        registry_.stack_under(id, sibling);
    }

    void SharedObjectRegistry::stack_above(ObjectId id, ObjectId sibling) {
        WriteLock lock(mutex_);
        registry_.stack_above(id, sibling);
    }

    ObjectId SharedObjectRegistry::parent(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.parent(id);
    }

    std::vector<ObjectId> SharedObjectRegistry::children(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.children(id);
    }

    std::vector<ObjectId> SharedObjectRegistry::ancestors(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.ancestors(id);
    }

    bool SharedObjectRegistry::is_ancestor_of(ObjectId candidate, ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.is_ancestor_of(candidate, id);
    }

    std::vector<ObjectId> SharedObjectRegistry::siblings(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.siblings(id);
    }

    boost::optional<size_t> SharedObjectRegistry::sibling_index(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.sibling_index(id);
    }

    ObjectId SharedObjectRegistry::next_sibling(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.next_sibling(id);
    }

    ObjectId SharedObjectRegistry::previous_sibling(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.previous_sibling(id);
    }

    std::vector<ObjectId> SharedObjectRegistry::depth_first_preorder(ObjectId root) const {
        ReadLock lock(mutex_);
        return registry_.depth_first_preorder(root);
    }

    std::vector<ObjectId> SharedObjectRegistry::depth_first_postorder(ObjectId root) const {
        ReadLock lock(mutex_);
        return registry_.depth_first_postorder(root);
    }

    std::vector<ObjectId> SharedObjectRegistry::breadth_first(ObjectId root) const {
        ReadLock lock(mutex_);
        return registry_.breadth_first(root);
    }

    std::vector<ObjectId> SharedObjectRegistry::root_objects() const {
        ReadLock lock(mutex_);
        return registry_.root_objects();
    }

    std::string SharedObjectRegistry::object_name(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.object_name(id);
    }

    void SharedObjectRegistry::set_object_name(ObjectId id, std::string name) {
        WriteLock lock(mutex_);
        registry_.set_object_name(id, std::move(name));
    }

    ObjectId SharedObjectRegistry::find_child_by_name(ObjectId id, const std::string& name) const {
        ReadLock lock(mutex_);
        return registry_.find_child_by_name(id, name);
    }

    std::vector<ObjectId> SharedObjectRegistry::find_descendants_by_name(ObjectId id,
                                                                         const std::string& name) const {
        ReadLock lock(mutex_);
        return registry_.find_descendants_by_name(id, name);
    }

    std::type_index SharedObjectRegistry::type_id(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.type_id(id);
    }

    std::string SharedObjectRegistry::type_name(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.type_name(id);
    }

    bool SharedObjectRegistry::has_dynamic_property(ObjectId id, const std::string& key) const {
        ReadLock lock(mutex_);
        return registry_.has_dynamic_property(id, key);
    }

    boost::any SharedObjectRegistry::remove_dynamic_property(ObjectId id, const std::string& key) {
        WriteLock lock(mutex_);
        return registry_.remove_dynamic_property(id, key);
    }

    std::vector<std::string> SharedObjectRegistry::dynamic_property_names(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.dynamic_property_names(id);
    }

    void SharedObjectRegistry::init_widget_state(ObjectId id, bool visible, bool enabled) {
        WriteLock lock(mutex_);
        registry_.init_widget_state(id, visible, enabled);
    }

    void SharedObjectRegistry::set_widget_visible(ObjectId id, bool visible) {
        WriteLock lock(mutex_);
        registry_.set_widget_visible(id, visible);
    }

    void SharedObjectRegistry::set_widget_enabled(ObjectId id, bool enabled) {
        WriteLock lock(mutex_);
        registry_.set_widget_enabled(id, enabled);
    }

    void SharedObjectRegistry::clear_widget_state(ObjectId id) {
        WriteLock lock(mutex_);
        registry_.clear_widget_state(id);
    }

    boost::optional<WidgetState> SharedObjectRegistry::widget_state(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.widget_state(id);
    }

    boost::optional<bool> SharedObjectRegistry::is_effectively_visible(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.is_effectively_visible(id);
    }

    boost::optional<bool> SharedObjectRegistry::is_effectively_enabled(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.is_effectively_enabled(id);
    }

    std::string SharedObjectRegistry::dump_object_tree(ObjectId id) const {
        ReadLock lock(mutex_);
        return registry_.dump_object_tree(id);
    }

} // namespace arbor
