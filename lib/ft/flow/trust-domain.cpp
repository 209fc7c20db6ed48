/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/flow/trust-domain.hpp>
#include <ft/logger.hpp>

namespace flow_turbo::flow {
    registry &trust_domain::_register(registry &types, const std::string &domain, const plugin_list &plugins)
    {
        for (const auto &p: plugins) {
            if (!p)
                throw error(fmt::format("trust domain {}: a plugin list must not contain null entries", domain));
            try {
                p->register_types(types);
            } catch (const std::exception &ex) {
                throw error(fmt::format("trust domain {}: failed to register the types of plugin {}", domain, p->name()), ex);
            }
            logger::debug("trust domain {}: registered plugin {}", domain, p->name());
        }
        return types;
    }

    whitelist::entry_list trust_domain::_collect(const registry &types, const std::string &domain,
        const plugin_list &plugins, const whitelist::entry_list &extra_flows)
    {
        whitelist::entry_list entries {};
        for (const auto &p: plugins) {
            for (auto &e: p->required_flows()) {
                if (!types.contains(e.name))
                    logger::warn("trust domain {}: plugin {} requires flow {} that no plugin registers", domain, p->name(), e.name);
                entries.emplace_back(std::move(e));
            }
        }
        for (const auto &e: extra_flows)
            entries.emplace_back(e);
        logger::info("trust domain {}: {} flow classes registered, whitelist: {}", domain, types.size(), entries);
        return entries;
    }

    trust_domain::trust_domain(std::string name, const plugin_list &plugins, const whitelist::entry_list &extra_flows):
        _name { std::move(name) },
        _flows { _collect(_register(_types, _name, plugins), _name, plugins, extra_flows) },
        _factory { _types, _flows }
    {
    }

    std::unique_ptr<trust_domain> trust_domain::from_config(std::string name, const plugin_list &plugins, const config &cfg)
    {
        whitelist::entry_list extra {};
        if (cfg.contains("flowWhitelist"))
            extra = whitelist::entries_from_json(cfg.at("flowWhitelist"));
        else
            logger::warn("trust domain {}: the configuration has no flowWhitelist element", name);
        return std::make_unique<trust_domain>(std::move(name), plugins, extra);
    }

    logic_ptr trust_domain::accept(const std::string_view encoded) const
    {
        return _factory.to_logic(codec::decode(encoded, _types));
    }
}
