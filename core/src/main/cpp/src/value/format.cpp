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

#include "format.h"

#include <iomanip>

namespace cval {

    namespace {
        void quote(ostream& os, const std::string& s) {
            os << '"';
            for (char c : s) {
                switch (c) {
                case '"':  os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:   os << c;
                }
            }
            os << '"';
        }

        void number(ostream& os, double n) {
            // 2^53: every integer below is exactly representable
            if (n == std::floor(n) && std::fabs(n) < 9007199254740992.0) {
                os << "cval.NumberIntVal(" << static_cast<long long>(n) << ")";
            } else {
                os << "cval.NumberFloatVal(" << std::setprecision(17) << n << ")";
            }
        }

        void write(ostream& os, const Value& v, int depth);

        void writeElements(ostream& os, const Value::Elements& elems, int depth) {
            os << "({";
            for (size_t i = 0; i < elems.size(); ++i) {
                if (i) os << ", ";
                write(os, elems[i], depth + 1);
            }
            os << "})";
        }

        void writeAttributes(ostream& os, const Value::Attributes& attrs, int depth) {
            os << "({";
            bool first = true;
            for (const auto& a : attrs) {
                if (!first) os << ", ";
                first = false;
                os << "{";
                quote(os, a.first);
                os << ", ";
                write(os, a.second, depth + 1);
                os << "}";
            }
            os << "})";
        }

        void writeRaw(ostream& os, const Value& v, int depth) {
            const Type& t = v.type();
            if (v.isNull()) {
                os << "cval.NullVal(" << t.goString() << ")";
                return;
            }
            if (!v.isKnown()) {
                if (t.isDynamic())
                    os << "cval.DynamicVal";
                else
                    os << "cval.UnknownVal(" << t.goString() << ")";
                return;
            }

            switch (t.kind()) {
            case Type::STRING:
                os << "cval.StringVal(";
                quote(os, v.asString());
                os << ")";
                break;
            case Type::NUMBER:
                number(os, v.asNumber());
                break;
            case Type::BOOL:
                os << (v.asBool() ? "cval.True" : "cval.False");
                break;
            case Type::LIST:
                if (v.length() == 0) {
                    os << "cval.ListValEmpty(" << t.elementType().goString() << ")";
                } else {
                    os << "cval.ListVal";
                    writeElements(os, v.elements(), depth);
                }
                break;
            case Type::SET:
                if (v.length() == 0) {
                    os << "cval.SetValEmpty(" << t.elementType().goString() << ")";
                } else {
                    os << "cval.SetVal";
                    writeElements(os, v.elements(), depth);
                }
                break;
            case Type::TUPLE:
                if (v.length() == 0) {
                    os << "cval.EmptyTupleVal";
                } else {
                    os << "cval.TupleVal";
                    writeElements(os, v.elements(), depth);
                }
                break;
            case Type::MAP:
                if (v.length() == 0) {
                    os << "cval.MapValEmpty(" << t.elementType().goString() << ")";
                } else {
                    os << "cval.MapVal";
                    writeAttributes(os, v.attributes(), depth);
                }
                break;
            case Type::OBJECT:
                if (v.length() == 0) {
                    os << "cval.EmptyObjectVal";
                } else {
                    os << "cval.ObjectVal";
                    writeAttributes(os, v.attributes(), depth);
                }
                break;
            default:
                os << "cval.Value(invalid)";
            }
        }

        void write(ostream& os, const Value& v, int depth) {
            if (depth > CVAL_GOSTRING_MAX_DEPTH) {
                os << "...";
                return;
            }
            writeRaw(os, v, depth);
            for (const Mark& m : v.marks()) {
                os << ".Mark(";
                quote(os, m.name());
                os << ")";
            }
        }
    }

    std::string goString(const Value& v) {
        ostringstream oss;
        write(oss, v, 0);
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const Value& v) {
        return os << goString(v);
    }

}
