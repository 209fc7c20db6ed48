/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/flow/registry.hpp>
#include <ft/logger.hpp>

namespace flow_turbo::flow {
    const type_info *registry::get(const std::string_view class_name) const
    {
        if (const auto it = _types.find(class_name); it != _types.end())
            return &it->second;
        return nullptr;
    }

    const type_info &registry::find(const std::string_view class_name, const app_context &ctx) const
    {
        const auto *info = get(class_name);
        if (!info)
            throw class_not_found_error(class_name, "as it is not a registered flow class");
        if (info->attachment && !ctx.contains(*info->attachment))
            throw class_not_found_error(class_name, fmt::format("as its attachment {} is not present in the context", *info->attachment));
        return *info;
    }

    const type_info &registry::find(const std::type_index type) const
    {
        const auto it = _names.find(type);
        if (it == _names.end())
            throw class_not_found_error(type.name(), "as its C++ type is not registered");
        return _types.at(it->second);
    }

    bool registry::contains(const std::string_view class_name) const
    {
        return _types.contains(class_name);
    }

    object_ptr registry::decode_object(const std::string_view class_name, const json::value &j) const
    {
        const auto it = _objects.find(class_name);
        if (it == _objects.end())
            throw class_not_found_error(class_name, "as it is not a registered argument class");
        auto obj = it->second(j);
        if (!obj)
            throw error(fmt::format("the decoder of {} returned no object for {}", class_name, json::serialize(j)));
        if (obj->class_name() != class_name)
            throw error(fmt::format("the decoder of {} returned an object of class {}", class_name, obj->class_name()));
        return obj;
    }

    type_info &registry::_add(const std::string_view class_name, const std::type_index type, const std::optional<code_hash> &attachment)
    {
        if (class_name.empty())
            throw error("a flow class name must not be empty!");
        if (_names.contains(type))
            throw error(fmt::format("C++ type {} is already registered as flow {}", type, _names.at(type)));
        const auto [it, created] = _types.try_emplace(std::string { class_name }, type_info { std::string { class_name }, type, attachment });
        if (!created)
            throw error(fmt::format("flow class {} is already registered", class_name));
        _names.emplace(type, it->first);
        logger::trace("registered flow class {} attachment: {}", class_name, attachment);
        return it->second;
    }

    void registry::_add_constructor(type_info &info, vector<param_spec> &&params, factory_func &&factory)
    {
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (it->name.empty())
                throw error(fmt::format("flow {}: constructor parameter #{} has no name", info.name, it - params.begin()));
            if (std::find_if(params.begin(), it, [&](const auto &p) { return p.name == it->name; }) != it)
                throw error(fmt::format("flow {}: duplicate constructor parameter name {}", info.name, it->name));
            if (it->default_value && !it->type.accepts(*it->default_value))
                throw error(fmt::format("flow {}: the default value {} is not accepted by the parameter {}", info.name, *it->default_value, *it));
        }
        logger::trace("flow {}: registered constructor {}", info.name, params);
        info.constructors.push_back(constructor_info { std::move(params), std::move(factory) });
    }

    void registry::_add_object(const std::string_view class_name, object_decoder &&decoder)
    {
        if (class_name.empty())
            throw error("an argument class name must not be empty!");
        const auto [it, created] = _objects.try_emplace(std::string { class_name }, std::move(decoder));
        if (!created)
            throw error(fmt::format("argument class {} is already registered", class_name));
    }
}
