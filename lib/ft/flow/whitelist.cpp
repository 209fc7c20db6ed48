/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/flow/whitelist.hpp>
#include <ft/logger.hpp>

namespace flow_turbo::flow {
    whitelist::entry_list whitelist::entries_from_json(const json::value &j)
    {
        entry_list entries {};
        for (const auto &item: json::as_array(j, "a flow whitelist")) {
            if (item.is_string()) {
                entries.emplace_back(std::string { item.get_string() });
                continue;
            }
            const auto &obj = json::as_object(item, "a flow whitelist entry");
            std::string name { json::as_string(json::at(obj, "name"), "a flow whitelist entry name") };
            std::optional<code_hash> attachment {};
            if (const auto *att = obj.if_contains("attachment"); att)
                attachment.emplace(code_hash::from_hex(json::as_string(*att, "a flow whitelist entry attachment")));
            entries.emplace_back(std::move(name), std::move(attachment));
        }
        return entries;
    }

    whitelist whitelist::from_config(const config &cfg, const std::string_view key)
    {
        if (!cfg.contains(key)) {
            logger::warn("the configuration has no {} element: no flows can be started by name", key);
            return {};
        }
        return whitelist { entries_from_json(cfg.at(key)) };
    }

    whitelist::whitelist(const entry_list &entries)
    {
        for (const auto &e: entries) {
            if (e.name.empty())
                throw error("a flow whitelist entry must have a non-empty name!");
            auto &r = _rules[e.name];
            if (e.attachment)
                r.attachments.emplace(*e.attachment);
            else
                r.any_attachment = true;
        }
    }

    bool whitelist::is_allowed(const std::string_view class_name, const app_context &ctx) const
    {
        const auto it = _rules.find(class_name);
        if (it == _rules.end())
            return false;
        if (it->second.any_attachment)
            return true;
        for (const auto &h: ctx.attachments) {
            if (it->second.attachments.find(h) != it->second.attachments.end())
                return true;
        }
        return false;
    }

    void whitelist::validate(const std::string_view class_name, const app_context &ctx) const
    {
        if (!is_allowed(class_name, ctx)) {
            logger::warn("rejected flow class {} with context {}: not on the whitelist", class_name, ctx);
            throw not_whitelisted_error(class_name);
        }
        logger::trace("flow class {} is on the whitelist", class_name);
    }
}
