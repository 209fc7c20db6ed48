/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/flow/ref-factory.hpp>
#include <ft/logger.hpp>

namespace flow_turbo::flow {
    static vector<std::string_view> arg_kinds(const value_list &args)
    {
        vector<std::string_view> kinds {};
        kinds.reserve(args.size());
        for (const auto &a: args)
            kinds.emplace_back(a.kind() == value_kind::object ? a.as_object().class_name() : kind_name(a.kind()));
        return kinds;
    }

    static bool matches_positional(const constructor_info &ctor, const value_list &args)
    {
        if (ctor.params.size() != args.size())
            return false;
        for (size_t i = 0; i < args.size(); ++i) {
            // null arguments are checked against the nullability by the named resolution
            if (!args[i].is_null() && !ctor.params[i].type.accepts_kind(args[i]))
                return false;
        }
        return true;
    }

    // returns the constructor arguments in the parameter order or nothing if the constructor does not match
    static std::optional<value_list> bind_named(const constructor_info &ctor, const arg_map &args)
    {
        value_list vals {};
        vals.reserve(ctor.params.size());
        size_t used = 0;
        for (const auto &p: ctor.params) {
            if (const auto it = args.find(p.name); it != args.end()) {
                if (!p.type.accepts(it->second))
                    return {};
                vals.emplace_back(it->second);
                ++used;
            } else if (p.default_value) {
                vals.emplace_back(*p.default_value);
            } else {
                return {};
            }
        }
        // parameter names are unique, so any difference means that some arguments were not used
        if (used != args.size())
            return {};
        return vals;
    }

    ref_factory::ref_factory(const registry &types, const whitelist &flows):
        _types { types }, _flows { flows }
    {
    }

    ref ref_factory::create(const std::type_index type, const value_list &args) const
    {
        const auto &info = _types.find(type);
        _flows.validate(info.name, info.context());
        const constructor_info *match = nullptr;
        size_t num_matches = 0;
        for (const auto &ctor: info.constructors) {
            if (matches_positional(ctor, args)) {
                match = &ctor;
                ++num_matches;
            }
        }
        if (num_matches == 0)
            throw no_matching_constructor_error(info.name, fmt::format("due to missing constructor for arguments: {}", arg_kinds(args)));
        if (num_matches > 1)
            throw ambiguous_constructor_error(info.name, fmt::format("due to ambiguous match against the constructors: {}", arg_kinds(args)));
        arg_map named {};
        for (size_t i = 0; i < args.size(); ++i)
            named.emplace(match->params[i].name, args[i]);
        return create_named(info.name, named);
    }

    ref ref_factory::create_named(const std::string_view class_name, const arg_map &args) const
    {
        const auto *info = _types.get(class_name);
        // the whitelist goes first so that callers cannot probe which flows are installed
        auto ctx = info ? info->context() : app_context {};
        _flows.validate(class_name, ctx);
        if (!info)
            throw class_not_found_error(class_name, "as it is not a registered flow class");
        _resolve(*info, args);
        logger::debug("created a flow reference to {} with args: {}", class_name, args);
        return { info->name, std::move(ctx), args };
    }

    logic_ptr ref_factory::to_logic(const ref &r) const
    {
        // pinned entries are checked against the attachment that provides the class, not the claimed context
        const auto *known = _types.get(r.class_name());
        _flows.validate(r.class_name(), known ? known->context() : app_context {});
        const auto &info = _types.find(r.class_name(), r.context());
        const auto res = _resolve(info, r.args());
        auto inst = res.ctor.factory(res.args);
        logger::debug("resolved a flow reference to {} with args: {}", r.class_name(), r.args());
        return inst;
    }

    ref_factory::resolved ref_factory::_resolve(const type_info &info, const arg_map &args)
    {
        for (const auto &ctor: info.constructors) {
            if (auto vals = bind_named(ctor, args); vals)
                return { ctor, std::move(*vals) };
        }
        throw no_matching_constructor_error(info.name, fmt::format("as could not find matching constructor for: {}", args));
    }
}
