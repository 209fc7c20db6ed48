/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_REF_HPP
#define FLOW_TURBO_FLOW_REF_HPP

#include <ft/flow/context.hpp>
#include <ft/flow/value.hpp>

namespace flow_turbo::flow {
    struct ref;
    struct registry;

    namespace codec {
        extern ref ref_from_json(const json::value &j, const registry &types);
    }

    /*
     * A flow instance that can be safely passed between processes: it holds only
     * the class identifier, the loader context, and the named constructor arguments.
     * Only a ref_factory, after a whitelist check, or the codec can create one.
     */
    struct ref {
        const std::string &class_name() const noexcept
        {
            return _class_name;
        }

        const app_context &context() const noexcept
        {
            return _context;
        }

        const arg_map &args() const noexcept
        {
            return _args;
        }

        bool operator==(const ref &o) const =default;
    private:
        friend struct ref_factory;
        friend ref codec::ref_from_json(const json::value &, const registry &);

        std::string _class_name;
        app_context _context;
        arg_map _args;

        ref(std::string class_name, app_context context, arg_map args):
            _class_name { std::move(class_name) }, _context { std::move(context) }, _args { std::move(args) }
        {
        }
    };
}

namespace fmt {
    template<>
    struct formatter<flow_turbo::flow::ref>: formatter<int> {
        template<typename FormatContext>
        auto format(const flow_turbo::flow::ref &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "flow_ref({} context: {} args: {})", v.class_name(), v.context(), v.args());
        }
    };
}

#endif // !FLOW_TURBO_FLOW_REF_HPP
