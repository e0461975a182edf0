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

#include "function.h"
#include "../marks/marks.h"

namespace cval {
namespace funcs {

    // Sensitivity operations. Each acts on the outer node's mark set only,
    // keeps every other mark and never changes the value's payload. They
    // accept every kind of value, including unknown, null and dynamic-typed
    // values, and report no errors of their own.

    /* Adds marks::Sensitive. Idempotent. */
    Value makeSensitive(const Value& v);

    /* Removes marks::Sensitive; a value without it is returned as is. */
    Value makeNonsensitive(const Value& v);

    bool isSensitive(const Value& v);

    /* makeNonsensitive if the value is sensitive, makeSensitive otherwise. */
    Value toggleSensitive(const Value& v);

    // The same operations as language functions taking one argument named
    // "value". issensitive returns a known bool.
    const Function& SensitiveFunc();
    const Function& NonsensitiveFunc();
    const Function& IsSensitiveFunc();
    const Function& ToggleSensitiveFunc();

    /* Table holding sensitive, nonsensitive, issensitive, togglesensitive. */
    FunctionTable sensitivityFunctions();

} // namespace funcs
} // namespace cval
