/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/common/test.hpp>
#include <ft/flow/mocks.hpp>
#include <ft/flow/ref-factory.hpp>

using namespace flow_turbo;
using namespace flow_turbo::flow;

namespace {
    template<typename T>
    std::unique_ptr<T> resolve_as(const ref_factory &factory, const ref &r)
    {
        auto inst = factory.to_logic(r);
        auto *typed = dynamic_cast<T *>(inst.get());
        if (!typed)
            throw error(fmt::format("{} resolved to an unexpected type", r.class_name()));
        inst.release();
        return std::unique_ptr<T> { typed };
    }
}

suite flow_ref_factory_suite = [] {
    "flow::ref_factory"_test = [] {
        registry types {};
        mocks::register_flows(types);
        const whitelist all { mocks::all_flows() };
        const ref_factory factory { types, all };

        "named"_test = [&] {
            const auto r = factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "b", "hi" } });
            test_same(std::string { mocks::example_flow::type_name }, r.class_name());
            test_same(app_context {}, r.context());
            test_same(size_t { 2 }, r.args().size());
            const auto ex = resolve_as<mocks::example_flow>(factory, r);
            test_same(int32_t { 1 }, ex->a);
            test_same(std::string { "hi" }, ex->b);
            test_same(value { "1:hi" }, ex->call());
        };
        "named with an empty whitelist"_test = [&] {
            const whitelist none {};
            const ref_factory f { types, none };
            expect(throws<not_whitelisted_error>([&] { f.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "b", "hi" } }); }));
            // the check does not depend on the validity of the arguments
            expect(throws<not_whitelisted_error>([&] { f.create_named(mocks::example_flow::type_name, { { "zzz", true } }); }));
            expect(throws<not_whitelisted_error>([&] { f.create<mocks::no_arg_flow>(); }));
        };
        "named with an unused key"_test = [&] {
            expect(throws<no_matching_constructor_error>([&] {
                factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "c", int32_t { 2 } } });
            }));
            expect(throws<no_matching_constructor_error>([&] {
                factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "b", "hi" }, { "c", int32_t { 2 } } });
            }));
        };
        "named with missing or mistyped arguments"_test = [&] {
            expect(throws<no_matching_constructor_error>([&] { factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } } }); }));
            expect(throws<no_matching_constructor_error>([&] { factory.create_named(mocks::example_flow::type_name, { { "a", int64_t { 1 } }, { "b", "hi" } }); }));
            expect(throws<no_matching_constructor_error>([&] { factory.create_named(mocks::example_flow::type_name, { { "a", nullptr }, { "b", "hi" } }); }));
            const auto msg = test_error_msg<no_matching_constructor_error>([&] {
                factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "c", int32_t { 2 } } });
            });
            test_same(std::optional<std::string> { "flow_ref cannot be constructed for flow logic of type net.example.Example as could not find matching constructor for: {a=1, c=2}" }, msg);
        };
        "named with an unknown class"_test = [&] {
            const whitelist wl { "net.example.Missing" };
            const ref_factory f { types, wl };
            expect(throws<class_not_found_error>([&] { f.create_named("net.example.Missing", {}); }));
            // not whitelisted takes precedence so that callers cannot probe for installed classes
            expect(throws<not_whitelisted_error>([&] { factory.create_named("net.example.Missing", {}); }));
        };
        "named with defaults"_test = [&] {
            const auto r = factory.create_named(mocks::issue_flow::type_name, { { "amount", int64_t { 100 } } });
            // defaults are not stored in the reference
            test_same(size_t { 1 }, r.args().size());
            const auto issue = resolve_as<mocks::issue_flow>(factory, r);
            test_same(int64_t { 100 }, issue->amount);
            test_same(std::string { "USD" }, issue->currency);
            expect(!issue->memo);
            const auto r2 = factory.create_named(mocks::issue_flow::type_name,
                { { "memo", "coupon" }, { "currency", "EUR" }, { "amount", int64_t { 7 } } });
            const auto issue2 = resolve_as<mocks::issue_flow>(factory, r2);
            test_same(std::string { "EUR" }, issue2->currency);
            test_same(std::optional<std::string> { "coupon" }, issue2->memo);
            const auto r3 = factory.create_named(mocks::issue_flow::type_name, { { "amount", int64_t { 7 } }, { "memo", nullptr } });
            expect(!resolve_as<mocks::issue_flow>(factory, r3)->memo);
        };
        "named takes the first declared match"_test = [&] {
            const auto r = factory.create_named(mocks::first_match_flow::type_name, { { "x", int32_t { 5 } } });
            const auto fm = resolve_as<mocks::first_match_flow>(factory, r);
            expect(fm->generic);
            test_same(value { int32_t { 5 } }, fm->x);
        };
        "named picks the constructor by parameter names"_test = [&] {
            const auto n = std::make_shared<const mocks::notary>("Notary A");
            const auto to_notary = resolve_as<mocks::payment_flow>(factory, factory.create_named(mocks::payment_flow::type_name, { { "notary", n } }));
            expect(to_notary->to_notary);
            const auto to_party = resolve_as<mocks::payment_flow>(factory, factory.create_named(mocks::payment_flow::type_name, { { "payee", n } }));
            expect(!to_party->to_notary);
            test_same(std::string { "Notary A" }, to_party->payee->name);
            expect(throws<no_matching_constructor_error>([&] {
                factory.create_named(mocks::payment_flow::type_name, { { "notary", std::make_shared<const mocks::party>("Bank A") } });
            }));
        };
        "positional"_test = [&] {
            const auto r = factory.create<mocks::example_flow>({ int32_t { 1 }, "hi" });
            test_same(value { int32_t { 1 } }, r.args().at("a"));
            test_same(value { "hi" }, r.args().at("b"));
            expect(r == factory.create_named(mocks::example_flow::type_name, { { "b", "hi" }, { "a", int32_t { 1 } } }));
            const auto ex = resolve_as<mocks::example_flow>(factory, r);
            test_same(int32_t { 1 }, ex->a);
            test_same(std::string { "hi" }, ex->b);
        };
        "positional with objects"_test = [&] {
            const auto r = factory.create<mocks::object_args_flow>({ std::make_shared<const mocks::param_type1>(1), std::make_shared<const mocks::param_type2>("Hello Jack") });
            const auto oa = resolve_as<mocks::object_args_flow>(factory, r);
            test_same(int32_t { 1 }, oa->a->value);
            test_same(std::string { "Hello Jack" }, oa->b->value);
            expect(throws<no_matching_constructor_error>([&] {
                factory.create<mocks::object_args_flow>({ std::make_shared<const mocks::param_type2>("x"), std::make_shared<const mocks::param_type1>(1) });
            }));
        };
        "positional without arguments"_test = [&] {
            const auto r = factory.create<mocks::no_arg_flow>();
            expect(r.args().empty());
            auto inst = factory.to_logic(r);
            test_same(value { int32_t { 42 } }, inst->call());
        };
        "positional with a wrong arity or kind"_test = [&] {
            expect(throws<no_matching_constructor_error>([&] { factory.create<mocks::example_flow>({ int32_t { 1 } }); }));
            expect(throws<no_matching_constructor_error>([&] { factory.create<mocks::example_flow>({ "hi", int32_t { 1 } }); }));
            const auto msg = test_error_msg<no_matching_constructor_error>([&] { factory.create<mocks::example_flow>({ 1.5 }); });
            test_same(std::optional<std::string> { "flow_ref cannot be constructed for flow logic of type net.example.Example due to missing constructor for arguments: [float64]" }, msg);
        };
        "positional null arguments"_test = [&] {
            // null matches by kind but the named resolution rejects a null for a non-nullable parameter
            expect(throws<no_matching_constructor_error>([&] { factory.create<mocks::example_flow>({ nullptr, "hi" }); }));
            expect(throws<ambiguous_constructor_error>([&] { factory.create<mocks::memo_flow>({ nullptr }); }));
            const auto text = resolve_as<mocks::memo_flow>(factory, factory.create<mocks::memo_flow>({ "note" }));
            test_same(std::optional<std::string> { "note" }, text->text);
            const auto bytes = resolve_as<mocks::memo_flow>(factory, factory.create<mocks::memo_flow>({ uint8_vector::from_hex("CAFE") }));
            expect(!bytes->text);
            test_same(uint8_vector::from_hex("CAFE"), *bytes->bytes);
        };
        "positional ambiguity"_test = [&] {
            // nullable and non-nullable declarations of the same kind are the same type
            expect(throws<ambiguous_constructor_error>([&] { factory.create<mocks::boxed_flow>({ int32_t { 3 } }); }));
            // an object assignable to both a base and a derived parameter
            expect(throws<ambiguous_constructor_error>([&] { factory.create<mocks::payment_flow>({ std::make_shared<const mocks::notary>("N") }); }));
            expect(throws<ambiguous_constructor_error>([&] { factory.create<mocks::first_match_flow>({ int32_t { 3 } }); }));
            const auto msg = test_error_msg<ambiguous_constructor_error>([&] { factory.create<mocks::boxed_flow>({ int32_t { 3 } }); });
            test_same(std::optional<std::string> { "flow_ref cannot be constructed for flow logic of type net.example.Boxed due to ambiguous match against the constructors: [int32]" }, msg);
            // only the base accepts a plain party
            const auto p = resolve_as<mocks::payment_flow>(factory, factory.create<mocks::payment_flow>({ std::make_shared<const mocks::party>("Bank B") }));
            expect(!p->to_notary);
            // a string is accepted only by the generic constructor
            const auto fm = resolve_as<mocks::first_match_flow>(factory, factory.create<mocks::first_match_flow>({ "s" }));
            expect(fm->generic);
        };
        "positional with an unregistered type"_test = [&] {
            expect(throws<class_not_found_error>([&] { factory.create<mocks::cash_flow>({ int64_t { 1 } }); }));
        };
        "resolve twice"_test = [&] {
            const auto r = factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 7 } }, { "b", "x" } });
            const auto i1 = resolve_as<mocks::example_flow>(factory, r);
            const auto i2 = resolve_as<mocks::example_flow>(factory, r);
            expect(i1.get() != i2.get());
            test_same(i1->a, i2->a);
            test_same(i1->b, i2->b);
        };
        "resolve rechecks the whitelist"_test = [&] {
            const auto r = factory.create_named(mocks::example_flow::type_name, { { "a", int32_t { 1 } }, { "b", "hi" } });
            const whitelist other_flows { mocks::no_arg_flow::type_name };
            const ref_factory receiver { types, other_flows };
            expect(throws<not_whitelisted_error>([&] { receiver.to_logic(r); }));
        };
        "resolve rechecks the constructors"_test = [&] {
            const auto r = factory.create<mocks::example_flow>({ int32_t { 1 }, "hi" });
            registry changed {};
            changed.add<mocks::example_flow>(mocks::example_flow::type_name).constructor<int32_t, std::string>({ "a", "text" });
            const ref_factory receiver { changed, all };
            expect(throws<no_matching_constructor_error>([&] { receiver.to_logic(r); }));
            registry empty {};
            const ref_factory receiver2 { empty, all };
            expect(throws<class_not_found_error>([&] { receiver2.to_logic(r); }));
        };
        "constructor errors propagate unwrapped"_test = [&] {
            const auto r = factory.create_named(mocks::failing_flow::type_name, { { "reason", "insufficient funds" } });
            const auto msg = test_error_msg<mocks::flow_failure>([&] { factory.to_logic(r); });
            test_same(std::optional<std::string> { "failing_flow: insufficient funds" }, msg);
        };
        "attachments"_test = [&] {
            const auto r = factory.create<mocks::attached_flow>({ 0.25 });
            test_same(app_context { { mocks::attachment_hash() } }, r.context());
            const auto af = resolve_as<mocks::attached_flow>(factory, r);
            test_same(0.25, af->rate);
            // an entry pinned to a different attachment does not allow the class
            const whitelist pinned { whitelist::entry { std::string { mocks::attached_flow::type_name }, attachment_id(std::string_view { "v2" }) } };
            const ref_factory f { types, pinned };
            expect(throws<not_whitelisted_error>([&] { f.create<mocks::attached_flow>({ 0.25 }); }));
        };
        "format"_test = [&] {
            const auto r = factory.create<mocks::example_flow>({ int32_t { 1 }, "hi" });
            test_same(std::string { "flow_ref(net.example.Example context: [] args: {a=1, b=\"hi\"})" }, fmt::format("{}", r));
        };
    };
};
