#pragma once
#ifndef FLOW_TURBO_ARRAY_HPP
#define FLOW_TURBO_ARRAY_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <cstring>
#include <span>
#include <ft/common/bytes.hpp>
#include <ft/common/error.hpp>
#include <ft/common/format.hpp>

namespace flow_turbo {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("byte_array must be initialized with {} bytes but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        explicit byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("byte_array requires a buffer of {} bytes but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<flow_turbo::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t> { v.data(), v.size() });
        }
    };
}

#endif //FLOW_TURBO_ARRAY_HPP
