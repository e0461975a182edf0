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

#include "type.h"

namespace cval {

    Type Type::List(const Type& elem) {
        Type t(LIST);
        t._elem = std::make_shared<Type>(elem);
        return t;
    }

    Type Type::Set(const Type& elem) {
        Type t(SET);
        t._elem = std::make_shared<Type>(elem);
        return t;
    }

    Type Type::Map(const Type& elem) {
        Type t(MAP);
        t._elem = std::make_shared<Type>(elem);
        return t;
    }

    Type Type::Object(const AttributeTypes& attrs) {
        Type t(OBJECT);
        t._attrs = std::make_shared<AttributeTypes>(attrs);
        return t;
    }

    Type Type::Tuple(const ElementTypes& elems) {
        Type t(TUPLE);
        t._elems = std::make_shared<ElementTypes>(elems);
        return t;
    }

    const Type& Type::elementType() const {
        if (!isCollection())
            throw std::logic_error("elementType() on " + friendlyName());
        return *_elem;
    }

    const Type::AttributeTypes& Type::attributeTypes() const {
        if (_kind != OBJECT)
            throw std::logic_error("attributeTypes() on " + friendlyName());
        return *_attrs;
    }

    bool Type::hasAttribute(const std::string& name) const {
        return attributeTypes().count(name) != 0;
    }

    const Type::ElementTypes& Type::tupleElementTypes() const {
        if (_kind != TUPLE)
            throw std::logic_error("tupleElementTypes() on " + friendlyName());
        return *_elems;
    }

    bool Type::equals(const Type& other) const {
        if (_kind != other._kind)
            return false;

        switch (_kind) {
        case LIST:
        case SET:
        case MAP:
            return _elem->equals(*other._elem);
        case OBJECT: {
            if (_attrs->size() != other._attrs->size())
                return false;
            auto it = _attrs->begin();
            auto ot = other._attrs->begin();
            for (; it != _attrs->end(); ++it, ++ot) {
                if (it->first != ot->first || !it->second.equals(ot->second))
                    return false;
            }
            return true;
        }
        case TUPLE: {
            if (_elems->size() != other._elems->size())
                return false;
            for (size_t i = 0; i < _elems->size(); ++i) {
                if (!(*_elems)[i].equals((*other._elems)[i]))
                    return false;
            }
            return true;
        }
        default:
            return true;
        }
    }

    bool Type::conformsTo(const Type& want) const {
        if (want.isDynamic())
            return true;
        if (_kind != want._kind)
            return false;

        switch (_kind) {
        case LIST:
        case SET:
        case MAP:
            return _elem->conformsTo(*want._elem);
        case OBJECT: {
            if (_attrs->size() != want._attrs->size())
                return false;
            for (const auto& attr : *want._attrs) {
                auto it = _attrs->find(attr.first);
                if (it == _attrs->end() || !it->second.conformsTo(attr.second))
                    return false;
            }
            return true;
        }
        case TUPLE: {
            if (_elems->size() != want._elems->size())
                return false;
            for (size_t i = 0; i < _elems->size(); ++i) {
                if (!(*_elems)[i].conformsTo((*want._elems)[i]))
                    return false;
            }
            return true;
        }
        default:
            return true;
        }
    }

    std::string Type::friendlyName() const {
        switch (_kind) {
        case DYNAMIC: return "dynamic";
        case STRING:  return "string";
        case NUMBER:  return "number";
        case BOOL:    return "bool";
        case LIST:    return "list of " + _elem->friendlyName();
        case SET:     return "set of " + _elem->friendlyName();
        case MAP:     return "map of " + _elem->friendlyName();
        case OBJECT:  return "object";
        case TUPLE:   return "tuple";
        }
        return "invalid type";
    }

    std::string Type::goString() const {
        switch (_kind) {
        case DYNAMIC: return "cval.DynamicPseudoType";
        case STRING:  return "cval.String";
        case NUMBER:  return "cval.Number";
        case BOOL:    return "cval.Bool";
        case LIST:    return "cval.List(" + _elem->goString() + ")";
        case SET:     return "cval.Set(" + _elem->goString() + ")";
        case MAP:     return "cval.Map(" + _elem->goString() + ")";
        case OBJECT: {
            if (_attrs->empty())
                return "cval.EmptyObject";
            ostringstream oss;
            oss << "cval.Object({";
            bool first = true;
            for (const auto& attr : *_attrs) {
                if (!first) oss << ", ";
                first = false;
                oss << "{\"" << attr.first << "\", " << attr.second.goString() << "}";
            }
            oss << "})";
            return oss.str();
        }
        case TUPLE: {
            if (_elems->empty())
                return "cval.EmptyTuple";
            ostringstream oss;
            oss << "cval.Tuple({";
            for (size_t i = 0; i < _elems->size(); ++i) {
                if (i) oss << ", ";
                oss << (*_elems)[i].goString();
            }
            oss << "})";
            return oss.str();
        }
        }
        return "cval.Type(invalid)";
    }

    std::ostream& operator<<(std::ostream& os, const Type& t) {
        return os << t.goString();
    }

}
