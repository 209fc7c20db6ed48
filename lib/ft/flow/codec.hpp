/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_CODEC_HPP
#define FLOW_TURBO_FLOW_CODEC_HPP

#include <ft/flow/ref.hpp>
#include <ft/flow/registry.hpp>

/*
 * JSON encoding of flow references:
 * {
 *   "flowLogicClassName": "net.example.Issue",
 *   "appContext": { "attachments": [ "<hex>" ] },
 *   "args": { "amount": { "type": "int64", "value": 100 }, "memo": null }
 * }
 * Argument objects are encoded as { "type": "object", "class": "<name>", "value": <json> }
 * and are decoded with the decoders of the receiving registry.
 */
namespace flow_turbo::flow::codec {
    extern json::value to_json(const value &v);
    extern value value_from_json(const json::value &j, const registry &types);
    extern json::value to_json(const ref &r);
    extern ref ref_from_json(const json::value &j, const registry &types);

    inline std::string encode(const ref &r)
    {
        return json::serialize(to_json(r));
    }

    inline ref decode(const std::string_view text, const registry &types)
    {
        return ref_from_json(json::parse(buffer { text }), types);
    }
}

#endif // !FLOW_TURBO_FLOW_CODEC_HPP
