/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_WHITELIST_HPP
#define FLOW_TURBO_FLOW_WHITELIST_HPP

#include <ft/config.hpp>
#include <ft/flow/context.hpp>
#include <ft/flow/error.hpp>

namespace flow_turbo::flow {
    /*
     * The set of flow classes that may be started by name.
     * This is the only barrier between an RPC caller or a peer and arbitrary code in the node,
     * so it is checked by the class identifier both when a reference is created and when it is resolved.
     * An entry may be pinned to an attachment, in which case the class is allowed only when
     * that attachment is part of the reference's context.
     */
    struct whitelist {
        struct entry {
            std::string name;
            std::optional<code_hash> attachment {};

            entry(const char *n): name { n }
            {
            }

            entry(const std::string_view n): name { n }
            {
            }

            entry(std::string n, std::optional<code_hash> a={}): name { std::move(n) }, attachment { std::move(a) }
            {
            }

            bool operator==(const entry &o) const =default;
        };
        using entry_list = vector<entry>;

        // parses an array of class names or { "name", "attachment" } objects
        static entry_list entries_from_json(const json::value &j);
        static whitelist from_config(const config &cfg, std::string_view key="flowWhitelist");

        whitelist() =default;
        explicit whitelist(const entry_list &entries);

        whitelist(const std::initializer_list<entry> entries): whitelist { entry_list { entries } }
        {
        }

        bool is_allowed(std::string_view class_name, const app_context &ctx) const;
        void validate(std::string_view class_name, const app_context &ctx) const;

        size_t size() const noexcept
        {
            return _rules.size();
        }

        bool empty() const noexcept
        {
            return _rules.empty();
        }
    private:
        struct rule {
            bool any_attachment = false;
            flat_set<code_hash> attachments {};
        };
        map<std::string, rule> _rules {};
    };
}

namespace fmt {
    template<>
    struct formatter<flow_turbo::flow::whitelist::entry>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.attachment)
                return fmt::format_to(ctx.out(), "{}@{}", v.name, *v.attachment);
            return fmt::format_to(ctx.out(), "{}", v.name);
        }
    };
}

#endif // !FLOW_TURBO_FLOW_WHITELIST_HPP
