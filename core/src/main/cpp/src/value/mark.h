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

#include "../pch.h"

namespace cval {

/**
 * Mark is an opaque token attached to a value node. Two marks are the
 * same mark when their names are equal; nothing else about a mark is
 * interpreted by the value model.
 */
class Mark {
public:
    explicit Mark(const std::string& name) : _name(name) {}
    explicit Mark(const char* name) : _name(name) {}

    const std::string& name() const { return _name; }

    bool operator==(const Mark& o) const { return _name == o._name; }
    bool operator!=(const Mark& o) const { return _name != o._name; }
    bool operator<(const Mark& o) const  { return _name < o._name; }

private:
    std::string _name;
};

typedef std::set<Mark> MarkSet;

inline std::ostream& operator<<(std::ostream& os, const Mark& m) {
    return os << "Mark(\"" << m.name() << "\")";
}

} // namespace cval
