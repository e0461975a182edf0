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

#include "function.h"
#include "../value/format.h"
#include "../marks/marks.h"
#include "../util/log.h"

namespace cval {
namespace funcs {

    Function::Function(const std::string& name, const Spec& spec)
        : _name(name), _spec(spec) {
        if (!_spec.type || !_spec.impl)
            throw std::invalid_argument("function " + name + " needs both a type and an impl");
    }

    void Function::checkArgs(const Args& args) const {
        const std::vector<Parameter>& params = _spec.params;
        if (args.size() != params.size()) {
            ostringstream oss;
            oss << "wrong number of arguments (" << params.size() << " required, "
                << args.size() << " given)";
            throw FunctionError(_name, oss.str());
        }

        for (size_t i = 0; i < params.size(); ++i) {
            const Parameter& p = params[i];
            const Value& arg = args[i];

            if (arg.isNull() && !p.allowNull)
                throw ArgError(_name, i, "argument \"" + p.name + "\" must not be null");

            // Dynamic-typed arguments are resolved later, or short-circuited in call()
            if (arg.type().isDynamic())
                continue;

            if (!arg.type().conformsTo(p.type))
                throw ArgError(_name, i, p.type.friendlyName() + " required, got " + arg.type().friendlyName());
        }
    }

    Type Function::returnType(const Args& args) const {
        checkArgs(args);
        return _spec.type(args);
    }

    Value Function::call(const Args& args) const {
        Type retType = returnType(args);
        const std::vector<Parameter>& params = _spec.params;

        MarkSet resultMarks;
        Args callArgs;
        callArgs.reserve(args.size());

        bool shortCircuit = false;
        for (size_t i = 0; i < params.size(); ++i) {
            const Parameter& p = params[i];
            Value arg = args[i];

            if (!p.allowMarked && arg.isMarked()) {
                std::pair<Value, MarkSet> parts = arg.unmark();
                arg = parts.first;
                resultMarks.insert(parts.second.begin(), parts.second.end());
            }

            if ((!arg.isKnown() && !p.allowUnknown) || (arg.type().isDynamic() && !p.allowDynamicType))
                shortCircuit = true;

            callArgs.push_back(arg);
        }

        if (shortCircuit) {
            if (logEnabled(LOG_TRACE))
                trace() << _name << ": unknown argument, result is unknown " << retType.goString();
            return UnknownVal(retType).withMarks(resultMarks);
        }

        if (logEnabled(LOG_TRACE)) {
            ostringstream oss;
            for (size_t i = 0; i < args.size(); ++i) {
                if (i) oss << ", ";
                // Sensitive data anywhere inside an argument is never logged
                if (marks::containsMark(args[i], marks::Sensitive))
                    oss << "(sensitive)";
                else
                    oss << goString(args[i]);
            }
            trace() << "calling " << _name << "(" << oss.str() << ")";
        }

        Value result = _spec.impl(callArgs, retType);

        if (!result.type().conformsTo(retType) && !result.type().isDynamic()) {
            throw FunctionError(_name, "returned " + result.type().friendlyName() +
                                       ", declared " + retType.friendlyName());
        }

        return result.withMarks(resultMarks);
    }

    Function::TypeFunc Function::staticReturnType(const Type& t) {
        return [t](const Args&) { return t; };
    }

    Function::TypeFunc Function::typeOfArgument(size_t index) {
        return [index](const Args& args) { return args.at(index).type(); };
    }

    void FunctionTable::add(const Function& f) {
        if (!_functions.insert(std::make_pair(f.name(), f)).second)
            throw std::invalid_argument("function " + f.name() + " is already defined");
    }

    bool FunctionTable::has(const std::string& name) const {
        return _functions.count(name) != 0;
    }

    const Function& FunctionTable::get(const std::string& name) const {
        auto it = _functions.find(name);
        if (it == _functions.end())
            throw FunctionError(name, "call to unknown function");
        return it->second;
    }

    Value FunctionTable::call(const std::string& name, const Function::Args& args) const {
        return get(name).call(args);
    }

    std::vector<std::string> FunctionTable::names() const {
        std::vector<std::string> out;
        out.reserve(_functions.size());
        for (const auto& f : _functions)
            out.push_back(f.first);
        return out;
    }

} // namespace funcs
} // namespace cval
