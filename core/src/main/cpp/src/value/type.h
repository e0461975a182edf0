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
 * Type describes the shape of a Value. Types are immutable and cheap to
 * copy; nested element and attribute types are shared.
 *
 * DynamicPseudoType is the "any type" placeholder: a value of that type
 * has not had its type resolved yet.
 */
class Type {
public:
    enum Kind : uint8_t {
        DYNAMIC,
        STRING,
        NUMBER,
        BOOL,
        LIST,
        SET,
        MAP,
        OBJECT,
        TUPLE
    };

    typedef std::map<std::string, Type> AttributeTypes;
    typedef std::vector<Type> ElementTypes;

    // Defaults to DynamicPseudoType
    Type() : _kind(DYNAMIC) {}

    static Type String()            { return Type(STRING); }
    static Type Number()            { return Type(NUMBER); }
    static Type Bool()              { return Type(BOOL); }
    static Type DynamicPseudoType() { return Type(DYNAMIC); }

    static Type List(const Type& elem);
    static Type Set(const Type& elem);
    static Type Map(const Type& elem);
    static Type Object(const AttributeTypes& attrs);
    static Type EmptyObject() { return Object(AttributeTypes()); }
    static Type Tuple(const ElementTypes& elems);
    static Type EmptyTuple()  { return Tuple(ElementTypes()); }

    Kind kind() const { return _kind; }

    bool isDynamic() const    { return _kind == DYNAMIC; }
    bool isPrimitive() const  { return _kind == STRING || _kind == NUMBER || _kind == BOOL; }
    bool isCollection() const { return _kind == LIST || _kind == SET || _kind == MAP; }
    bool isStructural() const { return _kind == OBJECT || _kind == TUPLE; }

    /* Element type of a list, set or map. Throws std::logic_error otherwise. */
    const Type& elementType() const;
    /* Attribute types of an object. Throws std::logic_error otherwise. */
    const AttributeTypes& attributeTypes() const;
    bool hasAttribute(const std::string& name) const;
    /* Element types of a tuple. Throws std::logic_error otherwise. */
    const ElementTypes& tupleElementTypes() const;

    bool equals(const Type& other) const;
    bool operator==(const Type& other) const { return equals(other); }
    bool operator!=(const Type& other) const { return !equals(other); }

    /**
     * True if a value of this type may be passed where `want` is expected.
     * DynamicPseudoType anywhere in `want` accepts any type at that position.
     */
    bool conformsTo(const Type& want) const;

    // "string", "list of number", "object", "dynamic"
    std::string friendlyName() const;
    // "cval.List(cval.String)"
    std::string goString() const;

private:
    explicit Type(Kind kind) : _kind(kind) {}

    Kind _kind;
    std::shared_ptr<const Type> _elem;
    std::shared_ptr<const AttributeTypes> _attrs;
    std::shared_ptr<const ElementTypes> _elems;
};

std::ostream& operator<<(std::ostream& os, const Type& t);

} // namespace cval
