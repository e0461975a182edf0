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

#include "sensitive.h"
#include "../util/log.h"

namespace cval {
namespace funcs {

    namespace {
        /* True if the value carries a mark other than marks::Sensitive. */
        bool hasForeignMarks(const Value& v) {
            for (const Mark& m : v.marks()) {
                if (m != marks::Sensitive)
                    return true;
            }
            return false;
        }

        // Type and mark names only, the payload never reaches the log
        std::string describe(const Value& v) {
            ostringstream oss;
            oss << v.type().friendlyName() << " value marked";
            for (const Mark& m : v.marks())
                oss << " " << m.name();
            return oss.str();
        }

        void logForeignMarks(const char* op, const Value& v) {
            if (logEnabled(LOG_DEBUG) && hasForeignMarks(v))
                debug() << op << ": keeping non-standard marks on " << describe(v);
        }

        Parameter anyValue() {
            Parameter p("value", Type::DynamicPseudoType());
            p.allowNull = true;
            p.allowUnknown = true;
            p.allowDynamicType = true;
            p.allowMarked = true;
            return p;
        }

        Function::Spec unarySpec(const std::string& description, const Function::TypeFunc& type,
                                 Value (*op)(const Value&)) {
            Function::Spec spec;
            spec.description = description;
            spec.params.push_back(anyValue());
            spec.type = type;
            spec.impl = [op](const Function::Args& args, const Type&) { return op(args[0]); };
            return spec;
        }

        Value isSensitiveVal(const Value& v) {
            return BoolVal(isSensitive(v));
        }
    }

    Value makeSensitive(const Value& v) {
        logForeignMarks("sensitive", v);
        return marks::attachMark(v, marks::Sensitive);
    }

    Value makeNonsensitive(const Value& v) {
        logForeignMarks("nonsensitive", v);
        return marks::detachMark(v, marks::Sensitive);
    }

    bool isSensitive(const Value& v) {
        return marks::hasMark(v, marks::Sensitive);
    }

    Value toggleSensitive(const Value& v) {
        if (isSensitive(v))
            return makeNonsensitive(v);
        return makeSensitive(v);
    }

    const Function& SensitiveFunc() {
        static const Function f("sensitive", unarySpec(
            "Treats the given value as sensitive, hiding it in rendered output.",
            Function::typeOfArgument(0), &makeSensitive));
        return f;
    }

    const Function& NonsensitiveFunc() {
        static const Function f("nonsensitive", unarySpec(
            "Removes the sensitive marking from the given value. Other marks are kept.",
            Function::typeOfArgument(0), &makeNonsensitive));
        return f;
    }

    const Function& IsSensitiveFunc() {
        static const Function f("issensitive", unarySpec(
            "Returns true if the given value is marked as sensitive.",
            Function::staticReturnType(Type::Bool()), &isSensitiveVal));
        return f;
    }

    const Function& ToggleSensitiveFunc() {
        static const Function f("togglesensitive", unarySpec(
            "Marks a non-sensitive value as sensitive and a sensitive value as non-sensitive.",
            Function::typeOfArgument(0), &toggleSensitive));
        return f;
    }

    FunctionTable sensitivityFunctions() {
        FunctionTable table;
        table.add(SensitiveFunc());
        table.add(NonsensitiveFunc());
        table.add(IsSensitiveFunc());
        table.add(ToggleSensitiveFunc());
        return table;
    }

} // namespace funcs
} // namespace cval
