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

#include "../value/value.h"

namespace cval {
namespace marks {

    /* The sensitivity mark. Process-wide constant. */
    extern const Mark Sensitive;

    // Mark set primitives. All of them act on the outer node only and
    // return a new value; the payload and every other mark are kept.
    Value attachMark(const Value& v, const Mark& m);
    Value detachMark(const Value& v, const Mark& m);
    bool hasMark(const Value& v, const Mark& m);

    /* True if `m` is on this node or on any nested value. */
    bool containsMark(const Value& v, const Mark& m);

} // namespace marks
} // namespace cval
