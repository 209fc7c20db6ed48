/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_CONTEXT_HPP
#define FLOW_TURBO_FLOW_CONTEXT_HPP

#include <algorithm>
#include <ft/blake2b.hpp>
#include <ft/container.hpp>

namespace flow_turbo::flow {
    // content hash of a code attachment
    using code_hash = blake2b_256_hash;

    inline code_hash attachment_id(const buffer &contents)
    {
        return blake2b<code_hash>(contents);
    }

    /*
     * Names the code attachments that must be loadable to resolve a flow class.
     * Travels inside a flow reference in place of an implicit class loader.
     */
    struct app_context {
        vector<code_hash> attachments {};

        bool contains(const code_hash &hash) const
        {
            return std::find(attachments.begin(), attachments.end(), hash) != attachments.end();
        }

        bool operator==(const app_context &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<flow_turbo::flow::app_context>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.attachments);
        }
    };
}

#endif // !FLOW_TURBO_FLOW_CONTEXT_HPP
