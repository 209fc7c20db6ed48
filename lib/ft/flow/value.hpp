/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_VALUE_HPP
#define FLOW_TURBO_FLOW_VALUE_HPP

#include <concepts>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <ft/flow/context.hpp>
#include <ft/json.hpp>

namespace flow_turbo::flow {
    /*
     * An application-defined argument type. Implementations must be immutable
     * and provide a static type_name that is unique within a registry.
     */
    struct object {
        virtual ~object() =default;
        virtual std::string_view class_name() const =0;
        virtual json::value to_json() const =0;
    };
    using object_ptr = std::shared_ptr<const object>;

    template<typename T>
    concept object_type = std::derived_from<T, object> && requires {
        { T::type_name } -> std::convertible_to<std::string_view>;
    };

    // integer types that have no dedicated value constructor
    template<typename T>
    concept other_integer = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, int32_t> && !std::same_as<T, int64_t>
        && !std::same_as<T, char> && !std::same_as<T, wchar_t> && !std::same_as<T, char8_t>
        && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

    enum class value_kind: uint8_t {
        null, boolean, int32, int64, float64, string, bytes, hash, object
    };

    extern std::string_view kind_name(value_kind kind);
    extern value_kind kind_from_name(std::string_view name);

    struct value {
        using value_type = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string, uint8_vector, code_hash, object_ptr>;
        static_assert(std::variant_size_v<value_type> == static_cast<size_t>(value_kind::object) + 1);

        value() =default;

        value(std::nullptr_t)
        {
        }

        value(const bool b): _val { b }
        {
        }

        value(const int32_t i): _val { i }
        {
        }

        value(const int64_t i): _val { i }
        {
        }

        // other integer types: 32-bit kind for those that always fit, 64-bit kind otherwise
        template<other_integer T>
        value(const T i)
        {
            if constexpr (std::in_range<int32_t>(std::numeric_limits<T>::min()) && std::in_range<int32_t>(std::numeric_limits<T>::max())) {
                _val.emplace<int32_t>(static_cast<int32_t>(i));
            } else {
                if (!std::in_range<int64_t>(i)) [[unlikely]]
                    throw error(fmt::format("integer {} does not fit into an int64 flow argument", i));
                _val.emplace<int64_t>(static_cast<int64_t>(i));
            }
        }

        value(const double d): _val { d }
        {
        }

        value(const char *s): _val { std::string { s } }
        {
        }

        value(const std::string_view s): _val { std::string { s } }
        {
        }

        value(std::string s): _val { std::move(s) }
        {
        }

        value(uint8_vector bytes): _val { std::move(bytes) }
        {
        }

        value(const code_hash &hash): _val { hash }
        {
        }

        template<std::derived_from<object> T>
        value(std::shared_ptr<T> obj)
        {
            if (obj)
                _val.emplace<object_ptr>(std::move(obj));
        }

        value_kind kind() const noexcept
        {
            return static_cast<value_kind>(_val.index());
        }

        bool is_null() const noexcept
        {
            return std::holds_alternative<std::monostate>(_val);
        }

        template<typename T>
        const T &get() const
        {
            if (const auto *ptr = std::get_if<T>(&_val); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("a flow argument of type {} was expected but got {}", typeid(T).name(), kind_name(kind())));
        }

        const object &as_object() const
        {
            return *get<object_ptr>();
        }

        const value_type &operator*() const noexcept
        {
            return _val;
        }

        bool operator==(const value &o) const;
    private:
        value_type _val {};
    };

    using value_list = vector<value>;
    using arg_map = map<std::string, value>;
}

namespace fmt {
    template<>
    struct formatter<flow_turbo::flow::value_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const flow_turbo::flow::value_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", flow_turbo::flow::kind_name(v));
        }
    };

    template<>
    struct formatter<flow_turbo::flow::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const flow_turbo::flow::value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace flow_turbo::flow;
            return std::visit([&](const auto &val) {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return fmt::format_to(ctx.out(), "null");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "\"{}\"", val);
                } else if constexpr (std::is_same_v<T, object_ptr>) {
                    return fmt::format_to(ctx.out(), "{}{}", val->class_name(), flow_turbo::json::serialize(val->to_json()));
                } else {
                    return fmt::format_to(ctx.out(), "{}", val);
                }
            }, *v);
        }
    };
}

#endif // !FLOW_TURBO_FLOW_VALUE_HPP
