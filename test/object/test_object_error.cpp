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

#include <gtest/gtest.h>
#include <string>
#include "../../src/object/object_error.h"

using namespace arbor;

TEST(ObjectErrorTest, MessagesPerCode) {
    EXPECT_STREQ(ObjectError(ObjectErrc::InvalidObjectId).what(),
                 "Invalid or destroyed object ID");
    EXPECT_STREQ(ObjectError(ObjectErrc::CircularParentage).what(),
                 "Cannot set an object as its own parent or ancestor");
    EXPECT_STREQ(ObjectError(ObjectErrc::PropertyNotFound).what(), "Property not found");
    EXPECT_STREQ(ObjectError(ObjectErrc::PropertyReadOnly).what(), "Property is read-only");
    EXPECT_STREQ(ObjectError(ObjectErrc::RegistryNotInitialized).what(),
                 "Object registry not initialized");
}

TEST(ObjectErrorTest, TypeMismatchCarriesBothTypes) {
    ObjectError err(ObjectErrc::PropertyTypeMismatch, "int", "std::string");
    EXPECT_EQ(err.code(), ObjectErrc::PropertyTypeMismatch);
    EXPECT_EQ(err.expected(), "int");
    EXPECT_EQ(err.got(), "std::string");
    EXPECT_STREQ(err.what(), "Property type mismatch: expected int, got std::string");
}

TEST(ObjectErrorTest, CatchableAsRuntimeError) {
    try {
        throw ObjectError(ObjectErrc::InvalidObjectId);
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid"), std::string::npos);
        return;
    }
    FAIL() << "ObjectError did not derive from std::runtime_error";
}

TEST(ObjectErrorTest, CodeNames) {
    EXPECT_STREQ(to_string(ObjectErrc::InvalidObjectId), "InvalidObjectId");
    EXPECT_STREQ(to_string(ObjectErrc::CircularParentage), "CircularParentage");
    EXPECT_STREQ(to_string(ObjectErrc::RegistryNotInitialized), "RegistryNotInitialized");
}
