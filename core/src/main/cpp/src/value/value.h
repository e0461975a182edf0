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
#include "type.h"
#include "mark.h"

namespace cval {

/**
 * Value is an immutable node of the dynamically typed value model.
 *
 * Every value has a Type and is in one of three states: known, unknown
 * (the data is not determined yet, the type may be) or null. Each node
 * carries its own MarkSet; marks on a collection are independent of the
 * marks on its elements.
 *
 * The payload is shared between copies, so operations that only change
 * the mark set never touch the data a value represents.
 */
class Value {
public:
    enum State : uint8_t {
        KNOWN,
        UNKNOWN,
        NULL_VALUE
    };

    typedef std::vector<Value> Elements;
    typedef std::map<std::string, Value> Attributes;

    // Null value of DynamicPseudoType
    Value();

    const Type& type() const { return _type; }
    State state() const { return _state; }

    bool isKnown() const { return _state != UNKNOWN; }
    bool isNull() const  { return _state == NULL_VALUE; }
    /* Known at every nesting level. */
    bool isWhollyKnown() const;

    // Payload access. Throws std::logic_error on unknown or null values and
    // on values of the wrong kind.
    const std::string& asString() const;
    double asNumber() const;
    bool asBool() const;

    /* Element or attribute count of a collection or structural value. */
    size_t length() const;
    /* Element of a list or tuple, with the element's own marks only. */
    Value index(size_t i) const;
    /* Element of a map, with the element's own marks only. */
    Value index(const std::string& key) const;
    /* Attribute of an object, with the attribute's own marks only. */
    Value getAttr(const std::string& name) const;
    /* Elements of a list, set or tuple, in order. */
    const Elements& elements() const;
    /* Entries of a map or attributes of an object, sorted by key. */
    const Attributes& attributes() const;

    // Marks, this node only
    Value mark(const Mark& m) const;
    Value withMarks(const MarkSet& marks) const;
    std::pair<Value, MarkSet> unmark() const;
    bool hasMark(const Mark& m) const { return _marks.count(m) != 0; }
    bool isMarked() const { return !_marks.empty(); }
    const MarkSet& marks() const { return _marks; }

    // Marks, every nesting level
    bool containsMarked() const;
    /* Strips marks from this node and all nested values, optionally
       collecting them into `collected`. */
    Value unmarkDeep(MarkSet* collected = nullptr) const;

    /**
     * Structural identity: same type, same state, same payload and the
     * same mark set at every level. Set elements compare without regard
     * to order.
     */
    bool rawEquals(const Value& other) const;

    friend Value StringVal(const std::string& s);
    friend Value NumberFloatVal(double n);
    friend Value BoolVal(bool b);
    friend Value ListVal(const Elements& elems);
    friend Value ListValEmpty(const Type& elem);
    friend Value SetVal(const Elements& elems);
    friend Value SetValEmpty(const Type& elem);
    friend Value MapVal(const Attributes& elems);
    friend Value MapValEmpty(const Type& elem);
    friend Value ObjectVal(const Attributes& attrs);
    friend Value TupleVal(const Elements& elems);
    friend Value NullVal(const Type& t);
    friend Value UnknownVal(const Type& t);

private:
    struct Payload;

    Value(const Type& type, State state, std::shared_ptr<const Payload> payload);

    /* Known, non-null payload of one of the given kinds. */
    const Payload& payload(const char* op, Type::Kind k1, Type::Kind k2 = Type::DYNAMIC) const;

    Type _type;
    State _state;
    std::shared_ptr<const Payload> _payload;
    MarkSet _marks;
};

Value StringVal(const std::string& s);
/* Numbers are doubles: throws std::invalid_argument when |n| > 2^53,
   where not every integer is exactly representable. */
Value NumberIntVal(int64_t n);
/* Throws std::invalid_argument for NaN. */
Value NumberFloatVal(double n);
Value BoolVal(bool b);

// Collection constructors throw std::invalid_argument when given no
// elements (use the ...Empty form) or elements of differing types.
// Element marks stay on the elements.
Value ListVal(const Value::Elements& elems);
Value ListValEmpty(const Type& elem);
/* Raw-equal duplicates are dropped, first occurrence wins. */
Value SetVal(const Value::Elements& elems);
Value SetValEmpty(const Type& elem);
Value MapVal(const Value::Attributes& elems);
Value MapValEmpty(const Type& elem);

Value ObjectVal(const Value::Attributes& attrs);
Value EmptyObjectVal();
Value TupleVal(const Value::Elements& elems);
Value EmptyTupleVal();

Value NullVal(const Type& t);
Value UnknownVal(const Type& t);
/* Unknown value of DynamicPseudoType. */
Value DynamicVal();

} // namespace cval
