/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <ft/flow/codec.hpp>

namespace flow_turbo::flow::codec {
    template<typename T>
    static T to_number(const json::value &j, const value_kind kind)
    {
        try {
            return j.to_number<T>();
        } catch (const std::exception &ex) {
            throw error(fmt::format("invalid {} flow argument: {}", kind_name(kind), json::serialize(j)), ex);
        }
    }

    // JSON numbers cannot hold non-finite values, so those travel as tagged strings
    static json::value float_to_json(const double d)
    {
        if (std::isnan(d))
            return "NaN";
        if (std::isinf(d))
            return d > 0 ? "Infinity" : "-Infinity";
        return d;
    }

    static double float_from_json(const json::value &j)
    {
        if (j.is_string()) {
            const std::string_view s = j.get_string();
            if (s == "NaN")
                return std::numeric_limits<double>::quiet_NaN();
            if (s == "Infinity")
                return std::numeric_limits<double>::infinity();
            if (s == "-Infinity")
                return -std::numeric_limits<double>::infinity();
            throw error(fmt::format("invalid float64 flow argument: {}", json::serialize(j)));
        }
        return to_number<double>(j, value_kind::float64);
    }

    json::value to_json(const value &v)
    {
        if (v.is_null())
            return nullptr;
        json::object j {};
        j.emplace("type", kind_name(v.kind()));
        std::visit([&](const auto &val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                // handled above
            } else if constexpr (std::is_same_v<T, uint8_vector> || std::is_same_v<T, code_hash>) {
                j.emplace("value", fmt::format("{}", val));
            } else if constexpr (std::is_same_v<T, double>) {
                j.emplace("value", float_to_json(val));
            } else if constexpr (std::is_same_v<T, object_ptr>) {
                j.emplace("class", val->class_name());
                j.emplace("value", val->to_json());
            } else {
                j.emplace("value", val);
            }
        }, *v);
        return j;
    }

    value value_from_json(const json::value &j, const registry &types)
    {
        if (j.is_null())
            return {};
        const auto &obj = json::as_object(j, "a flow argument");
        const auto kind = kind_from_name(json::as_string(json::at(obj, "type"), "a flow argument type"));
        const auto &val = json::at(obj, "value");
        switch (kind) {
            case value_kind::boolean:
                if (!val.is_bool())
                    throw error(fmt::format("invalid bool flow argument: {}", json::serialize(val)));
                return val.get_bool();
            case value_kind::int32: return to_number<int32_t>(val, kind);
            case value_kind::int64: return to_number<int64_t>(val, kind);
            case value_kind::float64: return float_from_json(val);
            case value_kind::string: return std::string { json::as_string(val, "a string flow argument") };
            case value_kind::bytes: return uint8_vector::from_hex(json::as_string(val, "a bytes flow argument"));
            case value_kind::hash: return code_hash::from_hex(json::as_string(val, "a hash flow argument"));
            case value_kind::object:
                return types.decode_object(json::as_string(json::at(obj, "class"), "a flow argument class"), val);
            default:
                throw error(fmt::format("unsupported flow argument: {}", json::serialize(j)));
        }
    }

    json::value to_json(const ref &r)
    {
        json::array attachments {};
        for (const auto &h: r.context().attachments)
            attachments.emplace_back(fmt::format("{}", h));
        json::object args {};
        for (const auto &[name, val]: r.args())
            args.emplace(name, to_json(val));
        return json::object {
            { "flowLogicClassName", r.class_name() },
            { "appContext", json::object { { "attachments", std::move(attachments) } } },
            { "args", std::move(args) }
        };
    }

    ref ref_from_json(const json::value &j, const registry &types)
    {
        const auto &obj = json::as_object(j, "a flow reference");
        std::string class_name { json::as_string(json::at(obj, "flowLogicClassName"), "a flow class name") };
        if (class_name.empty())
            throw error("a flow reference must have a non-empty class name!");
        app_context ctx {};
        const auto &j_ctx = json::as_object(json::at(obj, "appContext"), "a flow app context");
        for (const auto &h: json::as_array(json::at(j_ctx, "attachments"), "flow attachments"))
            ctx.attachments.emplace_back(code_hash::from_hex(json::as_string(h, "a flow attachment")));
        arg_map args {};
        for (const auto &kv: json::as_object(json::at(obj, "args"), "flow arguments"))
            args.emplace(std::string { kv.key() }, value_from_json(kv.value(), types));
        return { std::move(class_name), std::move(ctx), std::move(args) };
    }
}
