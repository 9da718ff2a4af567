#ifndef SPVD_HEADER_CHAIN_HPP
#define SPVD_HEADER_CHAIN_HPP
#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace spvd {
    class sync_state;

    // The headers after target up to and including tip, walking prev
    // links back from tip. Returned in ascending height order; empty when
    // tip == target. Throws user_error if target is not an ancestor of tip.
    std::vector<block_node> main_chain(sync_state& state, const std::string& tip, const std::string& target);

} // namespace spvd

#endif
