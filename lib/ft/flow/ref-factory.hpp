/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_REF_FACTORY_HPP
#define FLOW_TURBO_FLOW_REF_FACTORY_HPP

#include <ft/flow/ref.hpp>
#include <ft/flow/registry.hpp>
#include <ft/flow/whitelist.hpp>

namespace flow_turbo::flow {
    /*
     * Converts between live flow instances and flow references.
     * The whitelist is checked on the way in and on the way out since the two sides
     * may run in different processes with different whitelists.
     * Holds references to the registry and the whitelist, which must outlive it.
     */
    struct ref_factory {
        ref_factory(const registry &types, const whitelist &flows);

        // Creates a reference from positional arguments. Exactly one constructor of the type
        // must match by the number of arguments and their kinds; null arguments match any parameter.
        ref create(std::type_index type, const value_list &args) const;

        template<std::derived_from<logic> T>
        ref create(const value_list &args={}) const
        {
            return create(typeid(T), args);
        }

        // Creates a reference to the first declared constructor that consumes all the named arguments.
        // The constructor is not invoked.
        ref create_named(std::string_view class_name, const arg_map &args) const;

        // Rechecks the reference against the local whitelist and registry and invokes its constructor.
        // The class must be allowed for the attachment that provides it and that attachment must be in the context.
        // Exceptions thrown by the constructor itself are propagated as is.
        logic_ptr to_logic(const ref &r) const;
    private:
        struct resolved {
            const constructor_info &ctor;
            value_list args;
        };

        const registry &_types;
        const whitelist &_flows;

        static resolved _resolve(const type_info &info, const arg_map &args);
    };
}

#endif // !FLOW_TURBO_FLOW_REF_FACTORY_HPP
