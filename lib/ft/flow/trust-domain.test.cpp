/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/common/test.hpp>
#include <ft/flow/mocks.hpp>
#include <ft/flow/trust-domain.hpp>

using namespace flow_turbo;
using namespace flow_turbo::flow;

namespace {
    struct broken_plugin: plugin {
        std::string_view name() const override
        {
            return "net.example.broken";
        }

        void register_types(registry &types) const override
        {
            types.add<mocks::no_arg_flow>("");
        }
    };
}

suite flow_trust_domain_suite = [] {
    "flow::trust_domain"_test = [] {
        const plugin_list plugins { std::make_shared<mocks::example_plugin>(), std::make_shared<mocks::cash_plugin>() };
        "whitelist is the union of required and extra flows"_test = [&] {
            const trust_domain node { "node", plugins, { mocks::issue_flow::type_name } };
            test_same(std::string { "node" }, node.name());
            expect(node.types().contains(mocks::memo_flow::type_name));
            expect(node.types().contains(mocks::cash_flow::type_name));
            expect(node.flows().is_allowed(mocks::example_flow::type_name, {}));
            expect(node.flows().is_allowed(mocks::cash_flow::type_name, {}));
            expect(node.flows().is_allowed(mocks::issue_flow::type_name, {}));
            // a required but unregistered flow is allowed and fails later on resolution
            expect(node.flows().is_allowed("net.example.cash.Exit", {}));
            expect(!node.flows().is_allowed(mocks::memo_flow::type_name, {}));
            expect(throws<not_whitelisted_error>([&] { node.factory().create<mocks::memo_flow>({ "x" }); }));
        };
        "cross-domain references"_test = [&] {
            const trust_domain client { "client", plugins, { mocks::issue_flow::type_name, mocks::memo_flow::type_name } };
            const trust_domain node { "node", plugins, { mocks::issue_flow::type_name } };
            const auto issue = codec::encode(client.factory().create_named(mocks::issue_flow::type_name, { { "amount", int64_t { 10 } } }));
            test_same(value { "10 USD" }, node.accept(issue)->call());
            // the client allows the memo flow but the node does not
            const auto memo = codec::encode(client.factory().create<mocks::memo_flow>({ "x" }));
            expect(throws<not_whitelisted_error>([&] { node.accept(memo); }));
        };
        "receiver decodes with its own registry"_test = [&] {
            const trust_domain client { "client", plugins };
            const trust_domain node { "node", { std::make_shared<mocks::cash_plugin>() } };
            const auto objects = codec::encode(client.factory().create<mocks::object_args_flow>({
                std::make_shared<const mocks::param_type1>(1), std::make_shared<const mocks::param_type2>("Hello Jack") }));
            // the node has no decoder for the argument objects
            expect(throws<class_not_found_error>([&] { node.accept(objects); }));
            const auto cash = codec::encode(client.factory().create<mocks::cash_flow>({ int64_t { 5 } }));
            test_same(value { int64_t { 5 } }, node.accept(cash)->call());
        };
        "from config"_test = [&] {
            const config_json cfg { json::object {
                { "flowWhitelist", json::array { mocks::memo_flow::type_name } }
            } };
            const auto node = trust_domain::from_config("node", plugins, cfg);
            expect(node->flows().is_allowed(mocks::memo_flow::type_name, {}));
            expect(node->flows().is_allowed(mocks::object_args_flow::type_name, {}));
            const config_json empty_cfg { json::object {} };
            const auto node2 = trust_domain::from_config("node2", plugins, empty_cfg);
            expect(!node2->flows().is_allowed(mocks::memo_flow::type_name, {}));
            expect(node2->flows().is_allowed(mocks::object_args_flow::type_name, {}));
        };
        "registration failures"_test = [&] {
            expect(throws<error>([] { trust_domain d { "broken", { std::make_shared<broken_plugin>() } }; }));
            expect(throws<error>([] { trust_domain d { "null", { plugin_ptr {} } }; }));
            // both plugins register the same flow class
            expect(throws<error>([] { trust_domain d { "dup", { std::make_shared<mocks::cash_plugin>(), std::make_shared<mocks::cash_plugin>() } }; }));
        };
    };
};
