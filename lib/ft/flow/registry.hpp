/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_REGISTRY_HPP
#define FLOW_TURBO_FLOW_REGISTRY_HPP

#include <initializer_list>
#include <typeindex>
#include <ft/flow/error.hpp>
#include <ft/flow/logic.hpp>
#include <ft/flow/param.hpp>

namespace flow_turbo::flow {
    // receives the arguments bound in the parameter order with the defaults filled in
    using factory_func = std::function<logic_ptr(const value_list &)>;

    struct constructor_info {
        vector<param_spec> params {};
        factory_func factory {};
    };

    struct type_info {
        std::string name;
        std::type_index type;
        std::optional<code_hash> attachment {};
        // in the declaration order
        vector<constructor_info> constructors {};

        // the loader context required to resolve this type
        app_context context() const
        {
            if (attachment)
                return { { *attachment } };
            return {};
        }
    };

    using object_decoder = std::function<object_ptr(const json::value &)>;

    /*
     * Maps flow class identifiers to their declared constructors.
     * Replaces runtime reflection: every flow that can be started by name must be
     * registered explicitly together with the parameter names of its constructors.
     * Populated once at startup; all const methods are safe to call concurrently afterwards.
     */
    struct registry {
        template<std::derived_from<logic> T>
        struct type_builder {
            type_builder(registry &reg, type_info &info): _reg { reg }, _info { info }
            {
            }

            template<typename ...Args>
            type_builder &constructor(const std::initializer_list<param_decl> decls={})
            {
                static_assert(std::is_constructible_v<T, std::remove_cvref_t<Args>...>, "T must be constructible from Args");
                if (decls.size() != sizeof...(Args))
                    throw error(fmt::format("flow {}: {} parameter names were given for a constructor with {} parameters",
                        _info.name, decls.size(), sizeof...(Args)));
                vector<param_type> types { param_traits<std::remove_cvref_t<Args>>::type()... };
                vector<param_spec> params {};
                params.reserve(types.size());
                auto type_it = types.begin();
                for (const auto &d: decls)
                    params.push_back(param_spec { d.name, std::move(*type_it++), d.default_value });
                factory_func factory = [](const value_list &vals) -> logic_ptr {
                    if (vals.size() != sizeof...(Args)) [[unlikely]]
                        throw error(fmt::format("expected {} constructor arguments but got {}", sizeof...(Args), vals.size()));
                    return [&]<size_t ...I>(std::index_sequence<I...>) -> logic_ptr {
                        return std::make_unique<T>(param_traits<std::remove_cvref_t<Args>>::extract(vals[I])...);
                    }(std::index_sequence_for<Args...> {});
                };
                _reg._add_constructor(_info, std::move(params), std::move(factory));
                return *this;
            }
        private:
            registry &_reg;
            type_info &_info;
        };

        template<std::derived_from<logic> T>
        type_builder<T> add(const std::string_view class_name, const std::optional<code_hash> &attachment={})
        {
            return { *this, _add(class_name, typeid(T), attachment) };
        }

        template<object_type T>
        void add_object(std::function<std::shared_ptr<const T>(const json::value &)> decoder)
        {
            _add_object(T::type_name, [decoder=std::move(decoder)](const json::value &j) -> object_ptr {
                return decoder(j);
            });
        }

        // nullptr when no type with such name is registered
        const type_info *get(std::string_view class_name) const;
        // throws class_not_found_error unless the type is registered and loadable in the given context
        const type_info &find(std::string_view class_name, const app_context &ctx) const;
        const type_info &find(std::type_index type) const;
        bool contains(std::string_view class_name) const;
        object_ptr decode_object(std::string_view class_name, const json::value &j) const;

        size_t size() const noexcept
        {
            return _types.size();
        }
    private:
        map<std::string, type_info> _types {};
        unordered_map<std::type_index, std::string> _names {};
        map<std::string, object_decoder> _objects {};

        type_info &_add(std::string_view class_name, std::type_index type, const std::optional<code_hash> &attachment);
        void _add_constructor(type_info &info, vector<param_spec> &&params, factory_func &&factory);
        void _add_object(std::string_view class_name, object_decoder &&decoder);
    };
}

#endif // !FLOW_TURBO_FLOW_REGISTRY_HPP
