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
#include "../../src/object/object_registry.h"

using namespace arbor;

namespace {
    struct Widget {};
}

class WidgetStateTest : public ::testing::Test {
protected:
    ObjectRegistry registry;
    ObjectId window, panel, button;

    void SetUp() override {
        window = registry.register_object<Widget>();
        panel = registry.register_object<Widget>();
        button = registry.register_object<Widget>();
        registry.set_parent(panel, window);
        registry.set_parent(button, panel);
    }
};

TEST_F(WidgetStateTest, NoStateMeansNoAnswer) {
    EXPECT_FALSE(registry.widget_state(button));
    EXPECT_FALSE(registry.is_effectively_visible(button));
    EXPECT_FALSE(registry.is_effectively_enabled(button));
}

TEST_F(WidgetStateTest, InitDefaultsToVisibleAndEnabled) {
    registry.init_widget_state(button);

    boost::optional<WidgetState> state = registry.widget_state(button);
    ASSERT_TRUE(state);
    EXPECT_TRUE(state->visible);
    EXPECT_TRUE(state->enabled);

    boost::optional<bool> visible = registry.is_effectively_visible(button);
    ASSERT_TRUE(visible);
    EXPECT_TRUE(*visible);
}

TEST_F(WidgetStateTest, HiddenAncestorHidesDescendants) {
    registry.init_widget_state(window, false, true);
    registry.init_widget_state(panel);
    registry.init_widget_state(button);

    boost::optional<bool> visible = registry.is_effectively_visible(button);
    ASSERT_TRUE(visible);
    EXPECT_FALSE(*visible);

    boost::optional<bool> enabled = registry.is_effectively_enabled(button);
    ASSERT_TRUE(enabled);
    EXPECT_TRUE(*enabled);
}

TEST_F(WidgetStateTest, AncestorsWithoutStateAreTransparent) {
    registry.init_widget_state(window, true, false);
    registry.init_widget_state(button);

    // panel has no widget state; window's disabled flag still reaches button
    boost::optional<bool> enabled = registry.is_effectively_enabled(button);
    ASSERT_TRUE(enabled);
    EXPECT_FALSE(*enabled);
}

TEST_F(WidgetStateTest, OwnFlagWins) {
    registry.init_widget_state(window);
    registry.init_widget_state(button, false, true);

    boost::optional<bool> visible = registry.is_effectively_visible(button);
    ASSERT_TRUE(visible);
    EXPECT_FALSE(*visible);

    boost::optional<bool> window_visible = registry.is_effectively_visible(window);
    ASSERT_TRUE(window_visible);
    EXPECT_TRUE(*window_visible);
}

TEST_F(WidgetStateTest, SettersCreateStateWithOtherFlagTrue) {
    registry.set_widget_enabled(panel, false);

    boost::optional<WidgetState> state = registry.widget_state(panel);
    ASSERT_TRUE(state);
    EXPECT_TRUE(state->visible);
    EXPECT_FALSE(state->enabled);

    registry.set_widget_visible(panel, false);
    state = registry.widget_state(panel);
    ASSERT_TRUE(state);
    EXPECT_FALSE(state->visible);
    EXPECT_FALSE(state->enabled);
}

TEST_F(WidgetStateTest, ReparentingChangesEffectiveState) {
    ObjectId other = registry.register_object<Widget>();
    registry.init_widget_state(window, false, true);
    registry.init_widget_state(other);
    registry.init_widget_state(button);

    boost::optional<bool> before = registry.is_effectively_visible(button);
    ASSERT_TRUE(before);
    EXPECT_FALSE(*before);

    registry.set_parent(button, other);

    boost::optional<bool> after = registry.is_effectively_visible(button);
    ASSERT_TRUE(after);
    EXPECT_TRUE(*after);
}

TEST_F(WidgetStateTest, ClearRemovesOwnState) {
    registry.init_widget_state(panel, false, false);
    registry.init_widget_state(button);
    registry.clear_widget_state(panel);

    EXPECT_FALSE(registry.widget_state(panel));
    boost::optional<bool> visible = registry.is_effectively_visible(button);
    ASSERT_TRUE(visible);
    EXPECT_TRUE(*visible);
}

TEST_F(WidgetStateTest, DestroyedObjectThrows) {
    registry.destroy(panel);
    EXPECT_THROW(registry.init_widget_state(button), ObjectError);
    EXPECT_THROW(registry.is_effectively_visible(panel), ObjectError);
}
