#ifndef SPVD_OFFLINE_SIGNER_HPP
#define SPVD_OFFLINE_SIGNER_HPP
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace spvd {
    class Tx;

    // Add the signatures the account's master key can produce for the inputs
    // described by coins. master overrides the key stored with the account.
    // Existing multisig signatures in the inputs are preserved.
    void sign_offline_tx(const account& acc, const std::optional<std::string>& master, bool is_main_net, Tx& tx,
        const std::vector<coin_sign_data>& coins);

    // True if every input of tx carries a complete, valid standard p2pkh or
    // p2sh multisig signature set for its previous output in coins
    bool verify_std_tx(const Tx& tx, const std::vector<coin_sign_data>& coins);

} // namespace spvd

#endif
