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

#include "object_registry.h"
#include "../util/log.h"
#include <algorithm>
#include <queue>
#include <sstream>

namespace arbor {

    ObjectRegistry::ObjectRegistry(size_t initial_capacity)
        : objects_(initial_capacity) {}

    ObjectId ObjectRegistry::register_object(TypeTag type) {
        const std::string type_name = type.name;
        ObjectId id = objects_.insert(ObjectRecord(std::move(type)));
        trace() << "registered " << to_string(id) << " (" << type_name << ")";
        return id;
    }

    void ObjectRegistry::destroy(ObjectId id) {
        // Validates id before anything is touched; id itself comes last
        const std::vector<ObjectId> doomed = depth_first_postorder(id);

        detach_from_parent(id, record(id));

        for (ObjectId victim : doomed) {
            objects_.remove(victim);
        }
        trace() << "destroyed " << to_string(id) << " and "
                << static_cast<unsigned long>(doomed.size() - 1) << " descendants";
    }

    // ---------------------------------------------------------------------
    // Parenting
    // ---------------------------------------------------------------------

    void ObjectRegistry::set_parent(ObjectId id, ObjectId new_parent) {
        ObjectRecord& rec = record(id);

        if (new_parent.valid()) {
            if (!objects_.contains(new_parent)) {
                throw ObjectError(ObjectErrc::InvalidObjectId);
            }
            if (is_ancestor_of(id, new_parent)) {
                debug() << "rejected reparenting " << to_string(id) << " under "
                        << to_string(new_parent) << ": circular parentage";
                throw ObjectError(ObjectErrc::CircularParentage);
            }
        }

        detach_from_parent(id, rec);
        rec.parent = new_parent;
        if (new_parent.valid()) {
            record(new_parent).children.push_back(id);
        }
        debug() << "reparented " << to_string(id) << " under " << to_string(new_parent);
    }

    bool ObjectRegistry::is_ancestor_of(ObjectId candidate, ObjectId id) const {
        ObjectId current = id;
        const ObjectRecord* rec = &record(id);
        while (true) {
            if (current == candidate) {
                return true;
            }
            current = rec->parent;
            if (!current.valid()) {
                return false;
            }
            rec = objects_.try_get(current);
            if (!rec) {
                return false;
            }
        }
    }

    void ObjectRegistry::detach_from_parent(ObjectId id, const ObjectRecord& rec) {
        if (!rec.parent.valid()) {
            return;
        }
        ObjectRecord* parent = objects_.try_get(rec.parent);
        if (!parent) {
            return;
        }
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    }

    ObjectId ObjectRegistry::parent(ObjectId id) const {
        return record(id).parent;
    }

    const std::vector<ObjectId>& ObjectRegistry::children(ObjectId id) const {
        return record(id).children;
    }

    std::vector<ObjectId> ObjectRegistry::ancestors(ObjectId id) const {
        std::vector<ObjectId> result;
        ObjectId current = record(id).parent;
        while (current.valid()) {
            const ObjectRecord* rec = objects_.try_get(current);
            if (!rec) break;
            result.push_back(current);
            current = rec->parent;
        }
        return result;
    }

    // ---------------------------------------------------------------------
    // Sibling order
    // ---------------------------------------------------------------------

    std::vector<ObjectId>* ObjectRegistry::sibling_list(const ObjectRecord& rec) {
        if (!rec.parent.valid()) return nullptr;
        ObjectRecord* parent = objects_.try_get(rec.parent);
        return parent ? &parent->children : nullptr;
    }

    const std::vector<ObjectId>* ObjectRegistry::sibling_list(const ObjectRecord& rec) const {
        if (!rec.parent.valid()) return nullptr;
        const ObjectRecord* parent = objects_.try_get(rec.parent);
        return parent ? &parent->children : nullptr;
    }

    std::vector<ObjectId> ObjectRegistry::siblings(ObjectId id) const {
        std::vector<ObjectId> result;
        const std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return result;
        result.reserve(list->size());
        for (ObjectId sibling : *list) {
            if (sibling != id) {
                result.push_back(sibling);
            }
        }
        return result;
    }

    boost::optional<size_t> ObjectRegistry::sibling_index(ObjectId id) const {
        const std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return boost::none;
        auto it = std::find(list->begin(), list->end(), id);
        if (it == list->end()) return boost::none;
        return static_cast<size_t>(it - list->begin());
    }

    ObjectId ObjectRegistry::next_sibling(ObjectId id) const {
        const std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return ObjectId::invalid();
        auto it = std::find(list->begin(), list->end(), id);
        if (it == list->end() || it + 1 == list->end()) return ObjectId::invalid();
        return *(it + 1);
    }

    ObjectId ObjectRegistry::previous_sibling(ObjectId id) const {
        const std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return ObjectId::invalid();
        auto it = std::find(list->begin(), list->end(), id);
        if (it == list->end() || it == list->begin()) return ObjectId::invalid();
        return *(it - 1);
    }

    void ObjectRegistry::raise(ObjectId id) {
        std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return;
        auto it = std::find(list->begin(), list->end(), id);
        if (it == list->end()) return;
        std::rotate(it, it + 1, list->end());
        debug() << "raised " << to_string(id);
    }

    void ObjectRegistry::lower(ObjectId id) {
        std::vector<ObjectId>* list = sibling_list(record(id));
        if (!list) return;
        auto it = std::find(list->begin(), list->end(), id);
        if (it == list->end()) return;
        std::rotate(list->begin(), it, it + 1);
        debug() << "lowered " << to_string(id);
    }

    void ObjectRegistry::stack_under(ObjectId id, ObjectId sibling) {
        restack(id, sibling, false);
    }

    void ObjectRegistry::stack_above(ObjectId id, ObjectId sibling) {
        restack(id, sibling, true);
    }

    void ObjectRegistry::restack(ObjectId id, ObjectId sibling, bool above) {
        const ObjectRecord& rec = record(id);
        const ObjectRecord& other = record(sibling);
        if (!rec.parent.valid() || rec.parent != other.parent) {
            debug() << "rejected restacking " << to_string(id) << " against "
                    << to_string(sibling) << ": not siblings";
            throw ObjectError(ObjectErrc::InvalidObjectId);
        }
        if (id == sibling) {
            return;
        }

        std::vector<ObjectId>& list = record(rec.parent).children;
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
        auto pos = std::find(list.begin(), list.end(), sibling);
        if (above && pos != list.end()) {
            ++pos;
        }
        list.insert(pos, id);
        debug() << "stacked " << to_string(id) << (above ? " above " : " under ")
                << to_string(sibling);
    }

    // ---------------------------------------------------------------------
    // Traversal
    // ---------------------------------------------------------------------

    std::vector<ObjectId> ObjectRegistry::depth_first_preorder(ObjectId root) const {
        record(root);
        std::vector<ObjectId> result;
        std::vector<ObjectId> stack{root};
        while (!stack.empty()) {
            ObjectId current = stack.back();
            stack.pop_back();
            result.push_back(current);
            const auto& kids = record(current).children;
            // Push in reverse so the first child is visited first
            for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
                stack.push_back(*it);
            }
        }
        return result;
    }

    std::vector<ObjectId> ObjectRegistry::depth_first_postorder(ObjectId root) const {
        record(root);
        // Node-then-last-child-first order, reversed, is children-first post-order
        std::vector<ObjectId> result;
        std::vector<ObjectId> stack{root};
        while (!stack.empty()) {
            ObjectId current = stack.back();
            stack.pop_back();
            result.push_back(current);
            for (ObjectId child : record(current).children) {
                stack.push_back(child);
            }
        }
        std::reverse(result.begin(), result.end());
        return result;
    }

    std::vector<ObjectId> ObjectRegistry::breadth_first(ObjectId root) const {
        record(root);
        std::vector<ObjectId> result;
        std::queue<ObjectId> pending;
        pending.push(root);
        while (!pending.empty()) {
            ObjectId current = pending.front();
            pending.pop();
            result.push_back(current);
            for (ObjectId child : record(current).children) {
                pending.push(child);
            }
        }
        return result;
    }

    std::vector<ObjectId> ObjectRegistry::root_objects() const {
        std::vector<ObjectId> result;
        objects_.for_each([&result](ObjectId id, const ObjectRecord& rec) {
            if (!rec.parent.valid()) {
                result.push_back(id);
            }
        });
        return result;
    }

    // ---------------------------------------------------------------------
    // Naming and lookup
    // ---------------------------------------------------------------------

    const std::string& ObjectRegistry::object_name(ObjectId id) const {
        return record(id).name;
    }

    void ObjectRegistry::set_object_name(ObjectId id, std::string name) {
        record(id).name = std::move(name);
    }

    ObjectId ObjectRegistry::find_child_by_name(ObjectId id, const std::string& name) const {
        for (ObjectId child : record(id).children) {
            const ObjectRecord* rec = objects_.try_get(child);
            if (rec && rec->name == name) {
                return child;
            }
        }
        return ObjectId::invalid();
    }

    ObjectId ObjectRegistry::find_child(ObjectId id, const std::string& name,
                                        std::type_index type) const {
        for (ObjectId child : record(id).children) {
            const ObjectRecord* rec = objects_.try_get(child);
            if (rec && rec->name == name && rec->type_id == type) {
                return child;
            }
        }
        return ObjectId::invalid();
    }

    std::vector<ObjectId> ObjectRegistry::find_children_by_type(ObjectId id,
                                                                std::type_index type) const {
        std::vector<ObjectId> result;
        for (ObjectId child : record(id).children) {
            const ObjectRecord* rec = objects_.try_get(child);
            if (rec && rec->type_id == type) {
                result.push_back(child);
            }
        }
        return result;
    }

    std::vector<ObjectId> ObjectRegistry::find_descendants_by_name(ObjectId id,
                                                                   const std::string& name) const {
        std::vector<ObjectId> result;
        const std::vector<ObjectId> subtree = depth_first_preorder(id);
        // subtree.front() is id itself
        for (size_t i = 1; i < subtree.size(); ++i) {
            if (record(subtree[i]).name == name) {
                result.push_back(subtree[i]);
            }
        }
        return result;
    }

    std::type_index ObjectRegistry::type_id(ObjectId id) const {
        return record(id).type_id;
    }

    const std::string& ObjectRegistry::type_name(ObjectId id) const {
        return record(id).type_name;
    }

    // ---------------------------------------------------------------------
    // Dynamic properties
    // ---------------------------------------------------------------------

    const boost::any* ObjectRegistry::find_property(ObjectId id, const std::string& key) const {
        const auto& properties = record(id).properties;
        auto it = properties.find(key);
        return it == properties.end() ? nullptr : &it->second;
    }

    bool ObjectRegistry::has_dynamic_property(ObjectId id, const std::string& key) const {
        return find_property(id, key) != nullptr;
    }

    boost::any ObjectRegistry::remove_dynamic_property(ObjectId id, const std::string& key) {
        auto& properties = record(id).properties;
        auto it = properties.find(key);
        if (it == properties.end()) {
            return boost::any();
        }
        boost::any removed = std::move(it->second);
        properties.erase(it);
        return removed;
    }

    std::vector<std::string> ObjectRegistry::dynamic_property_names(ObjectId id) const {
        std::vector<std::string> names;
        const auto& properties = record(id).properties;
        names.reserve(properties.size());
        for (const auto& entry : properties) {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    // ---------------------------------------------------------------------
    // Widget state
    // ---------------------------------------------------------------------

    WidgetState& ObjectRegistry::ensure_widget_state(ObjectId id) {
        ObjectRecord& rec = record(id);
        if (!rec.widget_state) {
            rec.widget_state = WidgetState();
        }
        return *rec.widget_state;
    }

    void ObjectRegistry::init_widget_state(ObjectId id, bool visible, bool enabled) {
        WidgetState state;
        state.visible = visible;
        state.enabled = enabled;
        record(id).widget_state = state;
    }

    void ObjectRegistry::set_widget_visible(ObjectId id, bool visible) {
        ensure_widget_state(id).visible = visible;
    }

    void ObjectRegistry::set_widget_enabled(ObjectId id, bool enabled) {
        ensure_widget_state(id).enabled = enabled;
    }

    boost::optional<WidgetState> ObjectRegistry::widget_state(ObjectId id) const {
        return record(id).widget_state;
    }

    void ObjectRegistry::clear_widget_state(ObjectId id) {
        record(id).widget_state = boost::none;
    }

    boost::optional<bool> ObjectRegistry::is_effectively_visible(ObjectId id) const {
        return effective_flag(id, &WidgetState::visible);
    }

    boost::optional<bool> ObjectRegistry::is_effectively_enabled(ObjectId id) const {
        return effective_flag(id, &WidgetState::enabled);
    }

    boost::optional<bool> ObjectRegistry::effective_flag(ObjectId id, bool WidgetState::*flag) const {
        const ObjectRecord& rec = record(id);
        if (!rec.widget_state) {
            return boost::none;
        }
        if (!((*rec.widget_state).*flag)) {
            return boost::optional<bool>(false);
        }

        ObjectId current = rec.parent;
        while (current.valid()) {
            const ObjectRecord* ancestor = objects_.try_get(current);
            if (!ancestor) break;
            // Ancestors without widget state are transparent
            if (ancestor->widget_state && !((*ancestor->widget_state).*flag)) {
                return boost::optional<bool>(false);
            }
            current = ancestor->parent;
        }
        return boost::optional<bool>(true);
    }

    // ---------------------------------------------------------------------
    // Diagnostics
    // ---------------------------------------------------------------------

    std::string ObjectRegistry::dump_object_tree(ObjectId id) const {
        record(id);
        std::ostringstream out;
        std::vector<std::pair<ObjectId, size_t>> stack{{id, 0}};
        while (!stack.empty()) {
            const auto entry = stack.back();
            stack.pop_back();
            const ObjectRecord& rec = record(entry.first);

            out << std::string(entry.second * 2, ' ')
                << '[' << entry.first << "] "
                << (rec.name.empty() ? std::string("(unnamed)") : rec.name)
                << " (" << rec.type_name << ")\n";

            for (auto it = rec.children.rbegin(); it != rec.children.rend(); ++it) {
                stack.emplace_back(*it, entry.second + 1);
            }
        }
        return out.str();
    }

    // ---------------------------------------------------------------------
    // Record access
    // ---------------------------------------------------------------------

    const ObjectRecord& ObjectRegistry::record(ObjectId id) const {
        const ObjectRecord* rec = objects_.try_get(id);
        if (!rec) {
            throw ObjectError(ObjectErrc::InvalidObjectId);
        }
        return *rec;
    }

    ObjectRecord& ObjectRegistry::record(ObjectId id) {
        ObjectRecord* rec = objects_.try_get(id);
        if (!rec) {
            throw ObjectError(ObjectErrc::InvalidObjectId);
        }
        return *rec;
    }

} // namespace arbor
