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

#include "tree_format.h"

namespace arbor {

    TreeFormatOptions TreeFormatOptions::detailed() {
        TreeFormatOptions options;
        options.style = TreeStyle::Unicode;
        options.show_ids = true;
        options.show_types = true;
        options.show_properties = true;
        return options;
    }

    TreeFormatOptions TreeFormatOptions::minimal() {
        TreeFormatOptions options;
        options.style = TreeStyle::Compact;
        options.show_ids = false;
        options.show_types = false;
        options.show_properties = false;
        return options;
    }

    std::string TreeFormatter::short_type_name(const std::string& type_name) {
        // Search only the part before any template argument list
        const size_t pos = type_name.rfind("::", type_name.find('<'));
        if (pos == std::string::npos) {
            return type_name;
        }
        return type_name.substr(pos + 2);
    }

    std::string TreeFormatter::connector(bool is_last) const {
        const size_t dashes = options_.indent_size;
        switch (options_.style) {
            case TreeStyle::Ascii:
                return (is_last ? "`" : "+") + std::string(dashes, '-') + " ";
            case TreeStyle::Unicode: {
                std::string out = is_last ? "└" : "├";
                for (size_t i = 0; i < dashes; ++i) {
                    out += "─";
                }
                return out + " ";
            }
            case TreeStyle::Compact:
                break;
        }
        return std::string(options_.indent_size, ' ');
    }

    std::string TreeFormatter::continuation(const std::vector<bool>& open_levels) const {
        std::string out;
        for (bool open : open_levels) {
            switch (options_.style) {
                case TreeStyle::Ascii:
                    out += open ? "|" : " ";
                    out += std::string(options_.indent_size + 1, ' ');
                    break;
                case TreeStyle::Unicode:
                    out += open ? "│" : " ";
                    out += std::string(options_.indent_size + 1, ' ');
                    break;
                case TreeStyle::Compact:
                    out += std::string(options_.indent_size, ' ');
                    break;
            }
        }
        return out;
    }

    void TreeFormatter::format_node(const ObjectRegistry& registry, ObjectId id, size_t depth,
                                    bool is_last, std::vector<bool>& open_levels,
                                    std::string& out) const {
        if (depth > 0) {
            out += continuation(open_levels);
            out += connector(is_last);
        }

        const std::string& name = registry.object_name(id);
        out += name.empty() ? "(unnamed)" : name;
        if (options_.show_types) {
            out += " (" + short_type_name(registry.type_name(id)) + ")";
        }
        if (options_.show_ids) {
            out += " [" + to_string(id) + "]";
        }

        const std::vector<ObjectId>& children = registry.children(id);
        const bool truncated = options_.max_depth && depth >= *options_.max_depth;
        if (truncated && !children.empty()) {
            out += " ...";
        }
        out += "\n";

        // Children and property lines hang below this node
        if (depth > 0) {
            open_levels.push_back(!is_last);
        }

        if (options_.show_properties) {
            const std::string prefix = continuation(open_levels)
                                     + std::string(options_.indent_size, ' ');
            for (const std::string& key : registry.dynamic_property_names(id)) {
                out += prefix + "@" + key + "\n";
            }
        }

        if (!truncated) {
            for (size_t i = 0; i < children.size(); ++i) {
                format_node(registry, children[i], depth + 1, i + 1 == children.size(),
                            open_levels, out);
            }
        }

        if (depth > 0) {
            open_levels.pop_back();
        }
    }

    std::string TreeFormatter::format_subtree(const ObjectRegistry& registry, ObjectId root) const {
        if (!registry.contains(root)) {
            throw ObjectError(ObjectErrc::InvalidObjectId);
        }
        std::string out;
        std::vector<bool> open_levels;
        format_node(registry, root, 0, true, open_levels, out);
        return out;
    }

    std::string TreeFormatter::format_all(const ObjectRegistry& registry) const {
        std::string out = "Object Tree (" + std::to_string(registry.object_count())
                        + " total objects):\n";

        const std::vector<ObjectId> roots = registry.root_objects();
        if (roots.empty()) {
            out += "  (empty)\n";
            return out;
        }

        std::vector<bool> open_levels;
        for (ObjectId root : roots) {
            format_node(registry, root, 0, true, open_levels, out);
        }
        return out;
    }

} // namespace arbor
