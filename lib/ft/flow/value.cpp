/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <ft/flow/value.hpp>

namespace flow_turbo::flow {
    static constexpr std::array<std::string_view, 9> kind_names {
        "null", "bool", "int32", "int64", "float64", "string", "bytes", "hash", "object"
    };

    std::string_view kind_name(const value_kind kind)
    {
        const auto idx = static_cast<size_t>(kind);
        if (idx >= kind_names.size()) [[unlikely]]
            throw error(fmt::format("unsupported value kind: {}", idx));
        return kind_names[idx];
    }

    value_kind kind_from_name(const std::string_view name)
    {
        for (size_t i = 0; i < kind_names.size(); ++i) {
            if (kind_names[i] == name)
                return static_cast<value_kind>(i);
        }
        throw error(fmt::format("unknown value kind: {}", name));
    }

    bool value::operator==(const value &o) const
    {
        if (kind() != o.kind())
            return false;
        if (kind() == value_kind::object) {
            const auto &a = as_object();
            const auto &b = o.as_object();
            return &a == &b || (a.class_name() == b.class_name() && a.to_json() == b.to_json());
        }
        return _val == o._val;
    }
}
