/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_ERROR_HPP
#define FLOW_TURBO_FLOW_ERROR_HPP

#include <ft/common/error.hpp>
#include <ft/common/format.hpp>

namespace flow_turbo::flow {
    // A flow reference cannot be created or resolved for the given flow class
    struct logic_error: error {
        explicit logic_error(const std::string_view class_name, const std::string_view reason):
            error { fmt::format("flow_ref cannot be constructed for flow logic of type {} {}", class_name, reason) },
            _class_name { class_name }
        {
        }

        const std::string &class_name() const noexcept
        {
            return _class_name;
        }
    private:
        std::string _class_name;
    };

    struct not_whitelisted_error: logic_error {
        explicit not_whitelisted_error(const std::string_view class_name):
            logic_error { class_name, "as its type is not on the whitelist" }
        {
        }
    };

    struct class_not_found_error: logic_error {
        using logic_error::logic_error;
    };

    struct no_matching_constructor_error: logic_error {
        using logic_error::logic_error;
    };

    struct ambiguous_constructor_error: logic_error {
        using logic_error::logic_error;
    };
}

#endif // !FLOW_TURBO_FLOW_ERROR_HPP
