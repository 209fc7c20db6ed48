#pragma once
#ifndef FLOW_TURBO_CONTAINER_HPP
#define FLOW_TURBO_CONTAINER_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <map>
#include <unordered_map>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <ft/common/format.hpp>

namespace flow_turbo {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V, std::less<>>;

    template<typename K, typename V>
    using unordered_map = std::unordered_map<K, V>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;
    };
}

#endif //!FLOW_TURBO_CONTAINER_HPP
