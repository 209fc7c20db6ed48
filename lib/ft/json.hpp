/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_JSON_HPP
#define FLOW_TURBO_JSON_HPP

#include <boost/json.hpp>
#include <ft/common/bytes.hpp>
#include <ft/file.hpp>

namespace flow_turbo::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        try {
            return boost::json::parse(buf.string_view(), sp);
        } catch (const std::exception &ex) {
            throw error("failed to parse a json document", ex);
        }
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // returns the named member of a json object or throws an error naming the missing key
    inline const json::value &at(const json::object &obj, const std::string_view key)
    {
        const auto it = obj.find(key);
        if (it == obj.end())
            throw error(fmt::format("json object does not have the required element {}!", key));
        return it->value();
    }

    inline const json::object &as_object(const json::value &v, const std::string_view what)
    {
        if (!v.is_object())
            throw error(fmt::format("{} must be a json object but got: {}", what, json::serialize(v)));
        return v.get_object();
    }

    inline const json::array &as_array(const json::value &v, const std::string_view what)
    {
        if (!v.is_array())
            throw error(fmt::format("{} must be a json array but got: {}", what, json::serialize(v)));
        return v.get_array();
    }

    inline std::string_view as_string(const json::value &v, const std::string_view what)
    {
        if (!v.is_string())
            throw error(fmt::format("{} must be a json string but got: {}", what, json::serialize(v)));
        return v.get_string();
    }
}

#endif // !FLOW_TURBO_JSON_HPP
