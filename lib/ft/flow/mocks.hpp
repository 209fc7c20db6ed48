/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_MOCKS_HPP
#define FLOW_TURBO_FLOW_MOCKS_HPP

#include <ft/flow/plugin.hpp>

namespace flow_turbo::flow::mocks {
    struct param_type1: object {
        static constexpr std::string_view type_name = "net.example.ParamType1";
        int32_t value;

        explicit param_type1(const int32_t v): value { v }
        {
        }

        std::string_view class_name() const override
        {
            return type_name;
        }

        json::value to_json() const override
        {
            return json::object { { "value", value } };
        }

        static std::shared_ptr<const param_type1> from_json(const json::value &j)
        {
            return std::make_shared<const param_type1>(json::at(json::as_object(j, type_name), "value").to_number<int32_t>());
        }
    };

    struct param_type2: object {
        static constexpr std::string_view type_name = "net.example.ParamType2";
        std::string value;

        explicit param_type2(std::string v): value { std::move(v) }
        {
        }

        std::string_view class_name() const override
        {
            return type_name;
        }

        json::value to_json() const override
        {
            return json::object { { "value", value } };
        }

        static std::shared_ptr<const param_type2> from_json(const json::value &j)
        {
            return std::make_shared<const param_type2>(std::string { json::as_string(json::at(json::as_object(j, type_name), "value"), type_name) });
        }
    };

    struct party: object {
        static constexpr std::string_view type_name = "net.example.Party";
        std::string name;

        explicit party(std::string n): name { std::move(n) }
        {
        }

        std::string_view class_name() const override
        {
            return type_name;
        }

        json::value to_json() const override
        {
            return json::object { { "name", name } };
        }
    };

    struct notary: party {
        static constexpr std::string_view type_name = "net.example.Notary";
        using party::party;

        std::string_view class_name() const override
        {
            return type_name;
        }
    };

    struct example_flow: logic {
        static constexpr std::string_view type_name = "net.example.Example";
        int32_t a;
        std::string b;

        example_flow(const int32_t a_, std::string b_): a { a_ }, b { std::move(b_) }
        {
        }

        value call() override
        {
            return fmt::format("{}:{}", a, b);
        }
    };

    struct no_arg_flow: logic {
        static constexpr std::string_view type_name = "net.example.NoArg";

        value call() override
        {
            return int32_t { 42 };
        }
    };

    struct object_args_flow: logic {
        static constexpr std::string_view type_name = "net.example.ObjectArgs";
        std::shared_ptr<const param_type1> a;
        std::shared_ptr<const param_type2> b;

        object_args_flow(std::shared_ptr<const param_type1> a_, std::shared_ptr<const param_type2> b_):
            a { std::move(a_) }, b { std::move(b_) }
        {
        }

        value call() override
        {
            return fmt::format("{}:{}", a->value, b->value);
        }
    };

    // the same parameter declared nullable and non-nullable
    struct boxed_flow: logic {
        static constexpr std::string_view type_name = "net.example.Boxed";
        std::optional<int32_t> a;
        bool nullable;

        explicit boxed_flow(const int32_t a_): a { a_ }, nullable { false }
        {
        }

        explicit boxed_flow(const std::optional<int32_t> a_): a { a_ }, nullable { true }
        {
        }

        value call() override
        {
            if (a)
                return *a;
            return {};
        }
    };

    struct payment_flow: logic {
        static constexpr std::string_view type_name = "net.example.Payment";
        std::shared_ptr<const party> payee;
        bool to_notary;

        explicit payment_flow(std::shared_ptr<const party> p): payee { std::move(p) }, to_notary { false }
        {
        }

        explicit payment_flow(std::shared_ptr<const notary> p): payee { std::move(p) }, to_notary { true }
        {
        }

        value call() override
        {
            return payee->name;
        }
    };

    struct memo_flow: logic {
        static constexpr std::string_view type_name = "net.example.Memo";
        std::optional<std::string> text {};
        std::optional<uint8_vector> bytes {};

        explicit memo_flow(std::optional<std::string> t): text { std::move(t) }
        {
        }

        explicit memo_flow(std::optional<uint8_vector> b): bytes { std::move(b) }
        {
        }

        value call() override
        {
            if (text)
                return *text;
            if (bytes)
                return *bytes;
            return {};
        }
    };

    struct issue_flow: logic {
        static constexpr std::string_view type_name = "net.example.Issue";
        int64_t amount;
        std::string currency;
        std::optional<std::string> memo;

        issue_flow(const int64_t a, std::string c, std::optional<std::string> m):
            amount { a }, currency { std::move(c) }, memo { std::move(m) }
        {
        }

        value call() override
        {
            return fmt::format("{} {}", amount, currency);
        }
    };

    // both constructors accept { "x": int32 }
    struct first_match_flow: logic {
        static constexpr std::string_view type_name = "net.example.FirstMatch";
        value x;
        bool generic;

        explicit first_match_flow(value x_): x { std::move(x_) }, generic { true }
        {
        }

        explicit first_match_flow(const int32_t x_): x { x_ }, generic { false }
        {
        }

        value call() override
        {
            return x;
        }
    };

    struct flow_failure: error {
        using error::error;
    };

    struct failing_flow: logic {
        static constexpr std::string_view type_name = "net.example.Failing";

        explicit failing_flow(const std::string &reason)
        {
            throw flow_failure(fmt::format("failing_flow: {}", reason));
        }

        value call() override
        {
            return {};
        }
    };

    struct attached_flow: logic {
        static constexpr std::string_view type_name = "net.example.Attached";
        double rate;

        explicit attached_flow(const double r): rate { r }
        {
        }

        value call() override
        {
            return rate;
        }
    };

    struct cash_flow: logic {
        static constexpr std::string_view type_name = "net.example.cash.Move";
        int64_t amount;

        explicit cash_flow(const int64_t a): amount { a }
        {
        }

        value call() override
        {
            return amount;
        }
    };

    inline code_hash attachment_hash()
    {
        return attachment_id(std::string_view { "net.example attachment v1" });
    }

    inline void register_objects(registry &types)
    {
        types.add_object<param_type1>(param_type1::from_json);
        types.add_object<param_type2>(param_type2::from_json);
    }

    inline void register_flows(registry &types)
    {
        register_objects(types);
        types.add<example_flow>(example_flow::type_name).constructor<int32_t, std::string>({ "a", "b" });
        types.add<no_arg_flow>(no_arg_flow::type_name).constructor<>();
        types.add<object_args_flow>(object_args_flow::type_name)
            .constructor<std::shared_ptr<const param_type1>, std::shared_ptr<const param_type2>>({ "A", "b" });
        types.add<boxed_flow>(boxed_flow::type_name)
            .constructor<int32_t>({ "a" })
            .constructor<std::optional<int32_t>>({ "a" });
        types.add<payment_flow>(payment_flow::type_name)
            .constructor<std::shared_ptr<const party>>({ "payee" })
            .constructor<std::shared_ptr<const notary>>({ "notary" });
        types.add<memo_flow>(memo_flow::type_name)
            .constructor<std::optional<std::string>>({ "text" })
            .constructor<std::optional<uint8_vector>>({ "bytes" });
        types.add<issue_flow>(issue_flow::type_name)
            .constructor<int64_t, std::string, std::optional<std::string>>({ "amount", { "currency", "USD" }, { "memo", nullptr } });
        types.add<first_match_flow>(first_match_flow::type_name)
            .constructor<value>({ "x" })
            .constructor<int32_t>({ "x" });
        types.add<failing_flow>(failing_flow::type_name).constructor<std::string>({ "reason" });
        types.add<attached_flow>(attached_flow::type_name, attachment_hash()).constructor<double>({ "rate" });
    }

    inline whitelist::entry_list all_flows()
    {
        return {
            example_flow::type_name, no_arg_flow::type_name, object_args_flow::type_name, boxed_flow::type_name,
            payment_flow::type_name, memo_flow::type_name, issue_flow::type_name, first_match_flow::type_name,
            failing_flow::type_name, whitelist::entry { std::string { attached_flow::type_name }, attachment_hash() }
        };
    }

    // a plugin shipping the flows above
    struct example_plugin: plugin {
        std::string_view name() const override
        {
            return "net.example";
        }

        void register_types(registry &types) const override
        {
            register_flows(types);
        }

        whitelist::entry_list required_flows() const override
        {
            return { example_flow::type_name, no_arg_flow::type_name, object_args_flow::type_name };
        }
    };

    // a plugin that requires a flow it does not provide
    struct cash_plugin: plugin {
        std::string_view name() const override
        {
            return "net.example.cash";
        }

        void register_types(registry &types) const override
        {
            types.add<cash_flow>(cash_flow::type_name).constructor<int64_t>({ "amount" });
        }

        whitelist::entry_list required_flows() const override
        {
            return { cash_flow::type_name, "net.example.cash.Exit" };
        }
    };
}

#endif // !FLOW_TURBO_FLOW_MOCKS_HPP
