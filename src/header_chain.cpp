#include <algorithm>

#include "exception.hpp"
#include "header_chain.hpp"
#include "sync_state.hpp"

namespace spvd {

    namespace {
        static block_node get_known_header(sync_state& state, const std::string& hash)
        {
            auto node = state.get_header(hash);
            if (!node) {
                throw user_error("Unknown block " + hash);
            }
            return *node;
        }

        [[noreturn]] static void throw_not_ancestor(const std::string& target)
        {
            throw user_error("Block " + target + " is not an ancestor of the best block");
        }
    } // namespace

    std::vector<block_node> main_chain(sync_state& state, const std::string& tip, const std::string& target)
    {
        std::vector<block_node> ret;
        if (tip == target) {
            return ret;
        }

        const auto target_node = get_known_header(state, target);
        auto node = get_known_header(state, tip);
        if (target_node.height >= node.height) {
            throw_not_ancestor(target);
        }

        ret.reserve(node.height - target_node.height);
        while (node.height > target_node.height) {
            ret.push_back(node);
            node = get_known_header(state, node.prev_hash);
        }
        if (node.hash != target) {
            // Reached the target's height on a different branch
            throw_not_ancestor(target);
        }
        std::reverse(ret.begin(), ret.end());
        return ret;
    }

} // namespace spvd
