/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/common/bytes.hpp>
#include <ft/common/test.hpp>

using namespace flow_turbo;

suite bytes_suite = [] {
    "bytes"_test = [] {
        "uint_from_hex"_test = [] {
            test_same(uint8_t { 0 }, uint_from_hex('0'));
            test_same(uint8_t { 10 }, uint_from_hex('a'));
            test_same(uint8_t { 15 }, uint_from_hex('F'));
            expect(throws<error>([] { uint_from_hex('g'); }));
            // bytes above 0x7F arrive as negative chars
            expect(throws<error>([] { uint_from_hex(static_cast<char>(0xC1)); }));
            expect(throws<error>([] { uint_from_hex(static_cast<char>(0xFF)); }));
        };
        "from_hex"_test = [] {
            test_same(uint8_vector { buffer { std::string_view { "\xCA\xFE" } } }, uint8_vector::from_hex("cafe"));
            expect(throws<error>([] { uint8_vector::from_hex("CAF"); }));
            expect(throws<error>([] { uint8_vector::from_hex("CA\xC3\xA9"); }));
        };
        "format"_test = [] {
            test_same(std::string { "00FF10" }, fmt::format("{}", uint8_vector::from_hex("00ff10")));
        };
    };
};
