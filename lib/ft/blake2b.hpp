#pragma once
#ifndef FLOW_TURBO_BLAKE2B_HPP
#define FLOW_TURBO_BLAKE2B_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/array.hpp>
#include <ft/common/bytes.hpp>

namespace flow_turbo
{
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(void *out, size_t out_len, const void *in, size_t in_len);

    // T must be a byte_array with a size supported by blake2b
    template<typename T>
    T blake2b(const buffer &in)
    {
        T out;
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
        return out;
    }
}

#endif // !FLOW_TURBO_BLAKE2B_HPP
