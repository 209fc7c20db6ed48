/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FLOW_TURBO_FLOW_LOGIC_HPP
#define FLOW_TURBO_FLOW_LOGIC_HPP

#include <memory>
#include <ft/flow/value.hpp>

namespace flow_turbo::flow {
    /*
     * A unit of business logic that can be started by name on a remote node.
     * Instances are created by a ref_factory and executed by the flow state machine,
     * which is not a part of this library.
     */
    struct logic {
        virtual ~logic() =default;
        virtual value call() =0;
    };
    using logic_ptr = std::unique_ptr<logic>;
}

#endif // !FLOW_TURBO_FLOW_LOGIC_HPP
