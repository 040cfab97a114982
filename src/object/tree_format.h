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
#include <vector>
#include <boost/optional.hpp>
#include "../config.h"
#include "object_registry.h"
#include "shared_object_registry.h"

namespace arbor {

    enum class TreeStyle {
        Ascii,      // |   +-- `--
        Unicode,    // box-drawing connectors
        Compact     // indentation only
    };

    struct TreeFormatOptions {
        TreeStyle style = TreeStyle::Ascii;
        bool show_ids = false;
        bool show_types = true;
        bool show_properties = false;
        boost::optional<size_t> max_depth;     // none = unlimited; 0 = root only
        size_t indent_size = config::tree_format::kDefaultIndent;

        // Unicode connectors with ids, types and property keys
        static TreeFormatOptions detailed();

        // Names only, indentation only
        static TreeFormatOptions minimal();
    };

    /**
     * Renders ownership trees for debugging, one object per line:
     *
     *   window (Window) [ObjectId(0v1)]
     *   +-- toolbar (Panel) [ObjectId(1v1)]
     *   |   `-- save (Button) [ObjectId(3v1)]
     *   `-- body (Panel) [ObjectId(2v1)]
     *
     * Children appear in z-order, back to front.
     */
    class TreeFormatter {
    public:
        explicit TreeFormatter(TreeFormatOptions options = TreeFormatOptions())
            : options_(options) {}

        const TreeFormatOptions& options() const { return options_; }

        /**
         * @throws ObjectError InvalidObjectId if root does not resolve
         */
        std::string format_subtree(const ObjectRegistry& registry, ObjectId root) const;

        // Header line, then every root-level tree
        std::string format_all(const ObjectRegistry& registry) const;

        std::string format_subtree(const SharedObjectRegistry& registry, ObjectId root) const {
            return registry.with_read([this, root](const ObjectRegistry& r) {
                return format_subtree(r, root);
            });
        }

        std::string format_all(const SharedObjectRegistry& registry) const {
            return registry.with_read([this](const ObjectRegistry& r) {
                return format_all(r);
            });
        }

        // "arbor::ui::Button" -> "Button"; template arguments are left intact
        static std::string short_type_name(const std::string& type_name);

    private:
        // open_levels[i] is true while the ancestor at depth i+1 has later siblings
        void format_node(const ObjectRegistry& registry, ObjectId id, size_t depth,
                         bool is_last, std::vector<bool>& open_levels, std::string& out) const;

        std::string continuation(const std::vector<bool>& open_levels) const;
        std::string connector(bool is_last) const;

        TreeFormatOptions options_;
    };

} // namespace arbor
