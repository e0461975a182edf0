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
namespace funcs {

    /**
     * Failure reported by a language function call: wrong arity, unknown
     * function name, or an implementation returning the wrong type.
     */
    class FunctionError : public std::runtime_error {
    public:
        FunctionError(const std::string& function, const std::string& msg)
            : std::runtime_error(function + ": " + msg), _function(function) {}

        const std::string& function() const { return _function; }

    private:
        std::string _function;
    };

    /* A FunctionError attributed to one argument. */
    class ArgError : public FunctionError {
    public:
        ArgError(const std::string& function, size_t index, const std::string& msg)
            : FunctionError(function, argPrefix(index) + msg), _index(index) {}

        size_t index() const { return _index; }

    private:
        static std::string argPrefix(size_t index) {
            return "invalid value for argument " + std::to_string(index + 1) + ": ";
        }

        size_t _index;
    };

    struct Parameter {
        std::string name;
        Type type;

        bool allowNull;
        bool allowUnknown;
        bool allowDynamicType;
        // When false, marks are stripped before the call and re-applied
        // to the result.
        bool allowMarked;

        Parameter(const std::string& name, const Type& type)
            : name(name), type(type), allowNull(false), allowUnknown(false),
              allowDynamicType(false), allowMarked(false) {}
    };

    /**
     * A language function: a typed parameter list plus an implementation.
     * call() enforces the parameter contract so that implementations only
     * see the arguments they declared they can handle.
     */
    class Function {
    public:
        typedef std::vector<Value> Args;
        typedef std::function<Type(const Args&)> TypeFunc;
        typedef std::function<Value(const Args&, const Type& retType)> ImplFunc;

        struct Spec {
            std::string description;
            std::vector<Parameter> params;
            TypeFunc type;
            ImplFunc impl;
        };

        Function(const std::string& name, const Spec& spec);

        const std::string& name() const { return _name; }
        const std::string& description() const { return _spec.description; }
        const std::vector<Parameter>& params() const { return _spec.params; }

        /* Validates the arguments and returns the result type. */
        Type returnType(const Args& args) const;

        Value call(const Args& args) const;

        // Common TypeFunc shapes
        static TypeFunc staticReturnType(const Type& t);
        static TypeFunc typeOfArgument(size_t index);

    private:
        void checkArgs(const Args& args) const;

        std::string _name;
        Spec _spec;
    };

    class FunctionTable {
    public:
        /* Throws std::invalid_argument if the name is taken. */
        void add(const Function& f);
        bool has(const std::string& name) const;
        /* Throws FunctionError for an unknown name. */
        const Function& get(const std::string& name) const;
        Value call(const std::string& name, const Function::Args& args) const;

        std::vector<std::string> names() const;
        size_t size() const { return _functions.size(); }

    private:
        std::map<std::string, Function> _functions;
    };

} // namespace funcs
} // namespace cval
