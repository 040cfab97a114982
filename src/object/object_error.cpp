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

#include "object_error.h"
#include <utility>

namespace arbor {

    const char* to_string(ObjectErrc code) {
        switch (code) {
        case ObjectErrc::InvalidObjectId:        return "InvalidObjectId";
        case ObjectErrc::CircularParentage:      return "CircularParentage";
        case ObjectErrc::PropertyNotFound:       return "PropertyNotFound";
        case ObjectErrc::PropertyTypeMismatch:   return "PropertyTypeMismatch";
        case ObjectErrc::PropertyReadOnly:       return "PropertyReadOnly";
        case ObjectErrc::RegistryNotInitialized: return "RegistryNotInitialized";
        }
        return "Unknown";
    }

    ObjectError::ObjectError(ObjectErrc code)
        : ObjectError(code, std::string(), std::string()) {}

    ObjectError::ObjectError(ObjectErrc code, std::string expected, std::string got)
        : std::runtime_error(describe(code, expected, got)),
          code_(code),
          expected_(std::move(expected)),
          got_(std::move(got)) {}

    std::string ObjectError::describe(ObjectErrc code, const std::string& expected,
                                      const std::string& got) {
        switch (code) {
        case ObjectErrc::InvalidObjectId:
            return "Invalid or destroyed object ID";
        case ObjectErrc::CircularParentage:
            return "Cannot set an object as its own parent or ancestor";
        case ObjectErrc::PropertyNotFound:
            return "Property not found";
        case ObjectErrc::PropertyTypeMismatch:
            return "Property type mismatch: expected " + expected + ", got " + got;
        case ObjectErrc::PropertyReadOnly:
            return "Property is read-only";
        case ObjectErrc::RegistryNotInitialized:
            return "Object registry not initialized";
        }
        return "Unknown object error";
    }

} // namespace arbor
