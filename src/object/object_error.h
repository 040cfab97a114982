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

#include <stdexcept>
#include <string>

namespace arbor {

    /**
     * Kinds of failure reported by the object layer. There is a single
     * exception type; callers switch on ObjectError::code().
     */
    enum class ObjectErrc {
        InvalidObjectId,        // Unknown, destroyed or stale id; also "not siblings"
        CircularParentage,      // Reparenting would make an object its own ancestor
        PropertyNotFound,       // Strict property read of an absent key
        PropertyTypeMismatch,   // Strict property read with the wrong type
        PropertyReadOnly,       // Reserved
        RegistryNotInitialized  // Global registry used before init_global_registry()
    };

    const char* to_string(ObjectErrc code);

    class ObjectError : public std::runtime_error {
    public:
        explicit ObjectError(ObjectErrc code);

        // PropertyTypeMismatch carries the requested and stored type labels
        ObjectError(ObjectErrc code, std::string expected, std::string got);

        ObjectErrc code() const { return code_; }
        const std::string& expected() const { return expected_; }
        const std::string& got() const { return got_; }

    private:
        static std::string describe(ObjectErrc code, const std::string& expected,
                                    const std::string& got);

        ObjectErrc code_;
        std::string expected_;
        std::string got_;
    };

} // namespace arbor
