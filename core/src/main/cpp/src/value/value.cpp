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

#include "value.h"

namespace cval {

    struct Value::Payload {
        std::string str;
        double num;
        bool boolean;
        Elements elems;       // list, set, tuple
        Attributes attrs;     // map, object

        Payload() : num(0), boolean(false) {}
    };

    namespace {
        const char* stateName(Value::State s) {
            switch (s) {
            case Value::KNOWN:      return "known";
            case Value::UNKNOWN:    return "unknown";
            case Value::NULL_VALUE: return "null";
            }
            return "invalid";
        }

        /* All values must share one type; returns it. */
        Type commonElementType(const char* ctor, const Value::Elements& elems) {
            const Type& first = elems.front().type();
            for (size_t i = 1; i < elems.size(); ++i) {
                if (!elems[i].type().equals(first)) {
                    ostringstream oss;
                    oss << ctor << ": inconsistent element types (" << first.friendlyName()
                        << " at 0, " << elems[i].type().friendlyName() << " at " << i << ")";
                    throw std::invalid_argument(oss.str());
                }
            }
            return first;
        }

        Type commonElementType(const char* ctor, const Value::Attributes& elems) {
            const Type& first = elems.begin()->second.type();
            for (const auto& e : elems) {
                if (!e.second.type().equals(first)) {
                    ostringstream oss;
                    oss << ctor << ": inconsistent element types (" << first.friendlyName()
                        << " and " << e.second.type().friendlyName() << " at \"" << e.first << "\")";
                    throw std::invalid_argument(oss.str());
                }
            }
            return first;
        }
    }

    Value::Value() : _type(Type::DynamicPseudoType()), _state(NULL_VALUE) {}

    Value::Value(const Type& type, State state, std::shared_ptr<const Payload> payload)
        : _type(type), _state(state), _payload(std::move(payload)) {}

    const Value::Payload& Value::payload(const char* op, Type::Kind k1, Type::Kind k2) const {
        if (_state != KNOWN) {
            throw std::logic_error(std::string(op) + " on " + stateName(_state) + " " + _type.friendlyName() + " value");
        }
        if (_type.kind() != k1 && _type.kind() != k2) {
            throw std::logic_error(std::string(op) + " on " + _type.friendlyName() + " value");
        }
        return *_payload;
    }

    bool Value::isWhollyKnown() const {
        if (_state == UNKNOWN)
            return false;
        if (_state == NULL_VALUE)
            return true;
        for (const auto& e : _payload->elems) {
            if (!e.isWhollyKnown())
                return false;
        }
        for (const auto& a : _payload->attrs) {
            if (!a.second.isWhollyKnown())
                return false;
        }
        return true;
    }

    const std::string& Value::asString() const {
        return payload("asString()", Type::STRING).str;
    }

    double Value::asNumber() const {
        return payload("asNumber()", Type::NUMBER).num;
    }

    bool Value::asBool() const {
        return payload("asBool()", Type::BOOL).boolean;
    }

    size_t Value::length() const {
        if (_state == KNOWN && (_type.kind() == Type::MAP || _type.kind() == Type::OBJECT))
            return _payload->attrs.size();
        if (_state == KNOWN && (_type.kind() == Type::LIST || _type.kind() == Type::SET || _type.kind() == Type::TUPLE))
            return _payload->elems.size();
        payload("length()", Type::LIST);   // throws the right error
        return 0;
    }

    Value Value::index(size_t i) const {
        const Payload& p = payload("index()", Type::LIST, Type::TUPLE);
        if (i >= p.elems.size()) {
            ostringstream oss;
            oss << "index " << i << " out of range for " << _type.friendlyName()
                << " of length " << p.elems.size();
            throw std::out_of_range(oss.str());
        }
        return p.elems[i];
    }

    Value Value::index(const std::string& key) const {
        const Payload& p = payload("index()", Type::MAP);
        auto it = p.attrs.find(key);
        if (it == p.attrs.end())
            throw std::out_of_range("map has no element for key \"" + key + "\"");
        return it->second;
    }

    Value Value::getAttr(const std::string& name) const {
        const Payload& p = payload("getAttr()", Type::OBJECT);
        auto it = p.attrs.find(name);
        if (it == p.attrs.end())
            throw std::out_of_range("object has no attribute \"" + name + "\"");
        return it->second;
    }

    const Value::Elements& Value::elements() const {
        if (_type.kind() == Type::SET)
            return payload("elements()", Type::SET).elems;
        return payload("elements()", Type::LIST, Type::TUPLE).elems;
    }

    const Value::Attributes& Value::attributes() const {
        return payload("attributes()", Type::MAP, Type::OBJECT).attrs;
    }

    Value Value::mark(const Mark& m) const {
        Value v(*this);
        v._marks.insert(m);
        return v;
    }

    Value Value::withMarks(const MarkSet& marks) const {
        Value v(*this);
        v._marks.insert(marks.begin(), marks.end());
        return v;
    }

    std::pair<Value, MarkSet> Value::unmark() const {
        Value raw(*this);
        raw._marks.clear();
        return std::make_pair(raw, _marks);
    }

    bool Value::containsMarked() const {
        if (isMarked())
            return true;
        if (_state != KNOWN)
            return false;
        for (const auto& e : _payload->elems) {
            if (e.containsMarked())
                return true;
        }
        for (const auto& a : _payload->attrs) {
            if (a.second.containsMarked())
                return true;
        }
        return false;
    }

    Value Value::unmarkDeep(MarkSet* collected) const {
        if (collected)
            collected->insert(_marks.begin(), _marks.end());

        Value v(*this);
        v._marks.clear();
        if (_state != KNOWN || !containsMarked())
            return v;

        std::shared_ptr<Payload> p = std::make_shared<Payload>(*_payload);
        for (auto& e : p->elems)
            e = e.unmarkDeep(collected);
        for (auto& a : p->attrs)
            a.second = a.second.unmarkDeep(collected);
        v._payload = p;
        return v;
    }

    bool Value::rawEquals(const Value& other) const {
        if (_state != other._state || _marks != other._marks || !_type.equals(other._type))
            return false;
        if (_state != KNOWN)
            return true;
        if (_payload == other._payload)
            return true;

        const Payload& a = *_payload;
        const Payload& b = *other._payload;
        switch (_type.kind()) {
        case Type::STRING:
            return a.str == b.str;
        case Type::NUMBER:
            return a.num == b.num;
        case Type::BOOL:
            return a.boolean == b.boolean;
        case Type::LIST:
        case Type::TUPLE:
            if (a.elems.size() != b.elems.size())
                return false;
            for (size_t i = 0; i < a.elems.size(); ++i) {
                if (!a.elems[i].rawEquals(b.elems[i]))
                    return false;
            }
            return true;
        case Type::SET:
            if (a.elems.size() != b.elems.size())
                return false;
            // Elements are unique within each set, so containment both ways
            // reduces to containment one way.
            for (const auto& e : a.elems) {
                bool found = false;
                for (const auto& o : b.elems) {
                    if (e.rawEquals(o)) {
                        found = true;
                        break;
                    }
                }
                if (!found)
                    return false;
            }
            return true;
        case Type::MAP:
        case Type::OBJECT: {
            if (a.attrs.size() != b.attrs.size())
                return false;
            auto it = a.attrs.begin();
            auto ot = b.attrs.begin();
            for (; it != a.attrs.end(); ++it, ++ot) {
                if (it->first != ot->first || !it->second.rawEquals(ot->second))
                    return false;
            }
            return true;
        }
        default:
            return false;
        }
    }

    Value StringVal(const std::string& s) {
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->str = s;
        return Value(Type::String(), Value::KNOWN, p);
    }

    Value NumberIntVal(int64_t n) {
        const int64_t exact = int64_t(1) << 53;
        if (n > exact || n < -exact) {
            ostringstream oss;
            oss << "NumberIntVal: " << n << " is not exactly representable as a number value";
            throw std::invalid_argument(oss.str());
        }
        return NumberFloatVal(static_cast<double>(n));
    }

    Value NumberFloatVal(double n) {
        if (std::isnan(n))
            throw std::invalid_argument("NumberFloatVal: NaN is not a number value");
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->num = n;
        return Value(Type::Number(), Value::KNOWN, p);
    }

    Value BoolVal(bool b) {
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->boolean = b;
        return Value(Type::Bool(), Value::KNOWN, p);
    }

    Value ListVal(const Value::Elements& elems) {
        if (elems.empty())
            throw std::invalid_argument("ListVal: no elements, use ListValEmpty");
        Type elem = commonElementType("ListVal", elems);
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->elems = elems;
        return Value(Type::List(elem), Value::KNOWN, p);
    }

    Value ListValEmpty(const Type& elem) {
        return Value(Type::List(elem), Value::KNOWN, std::make_shared<Value::Payload>());
    }

    Value SetVal(const Value::Elements& elems) {
        if (elems.empty())
            throw std::invalid_argument("SetVal: no elements, use SetValEmpty");
        Type elem = commonElementType("SetVal", elems);
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        for (const auto& e : elems) {
            bool dup = false;
            for (const auto& kept : p->elems) {
                if (kept.rawEquals(e)) {
                    dup = true;
                    break;
                }
            }
            if (!dup)
                p->elems.push_back(e);
        }
        return Value(Type::Set(elem), Value::KNOWN, p);
    }

    Value SetValEmpty(const Type& elem) {
        return Value(Type::Set(elem), Value::KNOWN, std::make_shared<Value::Payload>());
    }

    Value MapVal(const Value::Attributes& elems) {
        if (elems.empty())
            throw std::invalid_argument("MapVal: no elements, use MapValEmpty");
        Type elem = commonElementType("MapVal", elems);
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->attrs = elems;
        return Value(Type::Map(elem), Value::KNOWN, p);
    }

    Value MapValEmpty(const Type& elem) {
        return Value(Type::Map(elem), Value::KNOWN, std::make_shared<Value::Payload>());
    }

    Value ObjectVal(const Value::Attributes& attrs) {
        Type::AttributeTypes types;
        for (const auto& a : attrs)
            types.insert(std::make_pair(a.first, a.second.type()));
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->attrs = attrs;
        return Value(Type::Object(types), Value::KNOWN, p);
    }

    Value EmptyObjectVal() {
        return ObjectVal(Value::Attributes());
    }

    Value TupleVal(const Value::Elements& elems) {
        Type::ElementTypes types;
        types.reserve(elems.size());
        for (const auto& e : elems)
            types.push_back(e.type());
        std::shared_ptr<Value::Payload> p = std::make_shared<Value::Payload>();
        p->elems = elems;
        return Value(Type::Tuple(types), Value::KNOWN, p);
    }

    Value EmptyTupleVal() {
        return TupleVal(Value::Elements());
    }

    Value NullVal(const Type& t) {
        return Value(t, Value::NULL_VALUE, nullptr);
    }

    Value UnknownVal(const Type& t) {
        return Value(t, Value::UNKNOWN, nullptr);
    }

    Value DynamicVal() {
        return UnknownVal(Type::DynamicPseudoType());
    }

}
