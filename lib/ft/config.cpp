/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ft/config.hpp>
#include <ft/logger.hpp>

namespace flow_turbo {
    static json::object load_object(const std::string &path)
    {
        auto doc = json::load(path);
        if (!doc.is_object())
            throw error(fmt::format("configuration file {} must contain a json object!", path));
        logger::debug("loaded configuration file: {}", path);
        return std::move(doc.as_object());
    }

    config_file::config_file(const std::string &path)
            : _path { path }, _parsed { load_object(path) }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }
}
