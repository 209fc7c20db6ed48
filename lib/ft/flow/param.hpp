/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_PARAM_HPP
#define FLOW_TURBO_FLOW_PARAM_HPP

#include <functional>
#include <optional>
#include <ft/flow/value.hpp>

namespace flow_turbo::flow {
    using object_filter = std::function<bool(const object &)>;

    struct param_type {
        std::string name {};
        // a parameter without a kind accepts values of any kind
        std::optional<value_kind> kind {};
        bool nullable = false;
        object_filter object_accepted {};

        // checks a non-null value; nullability is checked separately
        bool accepts_kind(const value &v) const
        {
            if (!kind)
                return true;
            if (v.kind() != *kind)
                return false;
            if (*kind == value_kind::object && object_accepted)
                return object_accepted(v.as_object());
            return true;
        }

        bool accepts(const value &v) const
        {
            if (v.is_null())
                return nullable;
            return accepts_kind(v);
        }
    };

    // a parameter as written at registration: a name and an optional default value
    struct param_decl {
        std::string name;
        std::optional<value> default_value {};

        param_decl(const char *n): name { n }
        {
        }

        param_decl(std::string n): name { std::move(n) }
        {
        }

        param_decl(std::string n, value def): name { std::move(n) }, default_value { std::move(def) }
        {
        }
    };

    struct param_spec {
        std::string name;
        param_type type;
        std::optional<value> default_value {};

        bool optional() const noexcept
        {
            return static_cast<bool>(default_value);
        }
    };

    template<typename T>
    struct param_traits;

    template<typename T, value_kind K>
    struct simple_param_traits {
        static param_type type()
        {
            return { std::string { kind_name(K) }, K };
        }

        static T extract(const value &v)
        {
            return v.get<T>();
        }
    };

    template<> struct param_traits<bool>: simple_param_traits<bool, value_kind::boolean> {};
    template<> struct param_traits<int32_t>: simple_param_traits<int32_t, value_kind::int32> {};
    template<> struct param_traits<int64_t>: simple_param_traits<int64_t, value_kind::int64> {};
    template<> struct param_traits<double>: simple_param_traits<double, value_kind::float64> {};
    template<> struct param_traits<std::string>: simple_param_traits<std::string, value_kind::string> {};
    template<> struct param_traits<uint8_vector>: simple_param_traits<uint8_vector, value_kind::bytes> {};
    template<> struct param_traits<code_hash>: simple_param_traits<code_hash, value_kind::hash> {};

    template<object_type T>
    struct param_traits<std::shared_ptr<const T>> {
        static param_type type()
        {
            return { std::string { T::type_name }, value_kind::object, false,
                [](const object &o) { return dynamic_cast<const T *>(&o) != nullptr; } };
        }

        static std::shared_ptr<const T> extract(const value &v)
        {
            auto ptr = std::dynamic_pointer_cast<const T>(v.get<object_ptr>());
            if (!ptr) [[unlikely]]
                throw error(fmt::format("a flow argument of class {} was expected but got {}", T::type_name, v.as_object().class_name()));
            return ptr;
        }
    };

    // std::optional marks a nullable parameter of the same kind
    template<typename T>
    struct param_traits<std::optional<T>> {
        static param_type type()
        {
            auto t = param_traits<T>::type();
            t.name += '?';
            t.nullable = true;
            return t;
        }

        static std::optional<T> extract(const value &v)
        {
            if (v.is_null())
                return {};
            return param_traits<T>::extract(v);
        }
    };

    template<>
    struct param_traits<value> {
        static param_type type()
        {
            return { "any?", {}, true };
        }

        static value extract(const value &v)
        {
            return v;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<flow_turbo::flow::param_spec>: formatter<int> {
        template<typename FormatContext>
        auto format(const flow_turbo::flow::param_spec &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.default_value)
                return fmt::format_to(ctx.out(), "{}: {} = {}", v.name, v.type.name, *v.default_value);
            return fmt::format_to(ctx.out(), "{}: {}", v.name, v.type.name);
        }
    };
}

#endif // !FLOW_TURBO_FLOW_PARAM_HPP
