/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_TRUST_DOMAIN_HPP
#define FLOW_TURBO_FLOW_TRUST_DOMAIN_HPP

#include <ft/flow/codec.hpp>
#include <ft/flow/plugin.hpp>
#include <ft/flow/ref-factory.hpp>

namespace flow_turbo::flow {
    /*
     * Everything a single process, a node or a client, needs to create and accept flow references:
     * its own registry, its own whitelist and a factory bound to them.
     * References arriving from another trust domain are decoded with the local registry
     * and checked against the local whitelist, never against the sender's.
     */
    struct trust_domain {
        trust_domain(std::string name, const plugin_list &plugins, const whitelist::entry_list &extra_flows={});
        trust_domain(const trust_domain &) =delete;
        trust_domain &operator=(const trust_domain &) =delete;

        // the whitelist is taken from the flowWhitelist element of the configuration
        static std::unique_ptr<trust_domain> from_config(std::string name, const plugin_list &plugins, const config &cfg);

        const std::string &name() const noexcept
        {
            return _name;
        }

        const registry &types() const noexcept
        {
            return _types;
        }

        const whitelist &flows() const noexcept
        {
            return _flows;
        }

        const ref_factory &factory() const noexcept
        {
            return _factory;
        }

        // decodes a reference received from another process and resolves it in this domain
        logic_ptr accept(std::string_view encoded) const;
    private:
        std::string _name;
        registry _types {};
        whitelist _flows;
        ref_factory _factory;

        static registry &_register(registry &types, const std::string &domain, const plugin_list &plugins);
        static whitelist::entry_list _collect(const registry &types, const std::string &domain,
            const plugin_list &plugins, const whitelist::entry_list &extra_flows);
    };
}

#endif // !FLOW_TURBO_FLOW_TRUST_DOMAIN_HPP
