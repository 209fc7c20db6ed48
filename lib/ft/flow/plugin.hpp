/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_PLUGIN_HPP
#define FLOW_TURBO_FLOW_PLUGIN_HPP

#include <ft/flow/registry.hpp>
#include <ft/flow/whitelist.hpp>

namespace flow_turbo::flow {
    // An installable application bundle: registers its flows and argument types and
    // names the flows that a node must allow to be started by name on its behalf.
    struct plugin {
        virtual ~plugin() =default;
        virtual std::string_view name() const =0;
        virtual void register_types(registry &types) const =0;

        virtual whitelist::entry_list required_flows() const
        {
            return {};
        }
    };
    using plugin_ptr = std::shared_ptr<const plugin>;
    using plugin_list = vector<plugin_ptr>;
}

#endif // !FLOW_TURBO_FLOW_PLUGIN_HPP
