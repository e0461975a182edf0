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

#include "marks.h"

namespace cval {
namespace marks {

    const Mark Sensitive(CVAL_SENSITIVE_MARK);

    Value attachMark(const Value& v, const Mark& m) {
        return v.mark(m);
    }

    Value detachMark(const Value& v, const Mark& m) {
        if (!v.hasMark(m))
            return v;
        std::pair<Value, MarkSet> parts = v.unmark();
        parts.second.erase(m);
        return parts.first.withMarks(parts.second);
    }

    bool hasMark(const Value& v, const Mark& m) {
        return v.hasMark(m);
    }

    bool containsMark(const Value& v, const Mark& m) {
        if (v.hasMark(m))
            return true;
        if (!v.isKnown() || v.isNull())
            return false;

        switch (v.type().kind()) {
        case Type::LIST:
        case Type::SET:
        case Type::TUPLE:
            for (const auto& e : v.elements()) {
                if (containsMark(e, m))
                    return true;
            }
            return false;
        case Type::MAP:
        case Type::OBJECT:
            for (const auto& a : v.attributes()) {
                if (containsMark(a.second, m))
                    return true;
            }
            return false;
        default:
            return false;
        }
    }

} // namespace marks
} // namespace cval
