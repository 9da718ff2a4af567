#include <algorithm>
#include <map>

#include "exception.hpp"
#include "logging.hpp"
#include "offline_signer.hpp"
#include "wally.hpp"

namespace spvd {

    namespace {
        constexpr uint32_t DERIVE_PRIVATE = BIP32_FLAG_KEY_PRIVATE | BIP32_FLAG_SKIP_HASH;
        constexpr uint32_t DERIVE_PUBLIC = BIP32_FLAG_KEY_PUBLIC | BIP32_FLAG_SKIP_HASH;

        struct multisig_script {
            uint32_t threshold;
            std::vector<pub_key_t> pubkeys;
        };

        // Parse a bare OP_m <pubkey>... OP_n OP_CHECKMULTISIG script
        static std::optional<multisig_script> parse_multisig(byte_span_t script)
        {
            if (scriptpubkey_get_type(script) != WALLY_SCRIPT_TYPE_MULTISIG) {
                return {};
            }
            multisig_script ret;
            ret.threshold = script[0] - OP_1 + 1;
            const size_t keys_end = script.size() - 2;
            size_t pos = 1;
            while (pos < keys_end) {
                if (script[pos] != EC_PUBLIC_KEY_LEN || pos + 1 + EC_PUBLIC_KEY_LEN > keys_end) {
                    return {};
                }
                pub_key_t key;
                std::copy(script.begin() + pos + 1, script.begin() + pos + 1 + EC_PUBLIC_KEY_LEN, key.begin());
                ret.pubkeys.push_back(key);
                pos += 1 + EC_PUBLIC_KEY_LEN;
            }
            if (static_cast<size_t>(script[keys_end] - OP_1 + 1) != ret.pubkeys.size()
                || script[keys_end + 1] != OP_CHECKMULTISIG) {
                return {};
            }
            return ret;
        }

        static bool signature_matches(const pub_key_t& pubkey, byte_span_t hash, byte_span_t der)
        {
            if (der.empty() || der.back() != WALLY_SIGHASH_ALL) {
                return false;
            }
            try {
                return ec_sig_verify(pubkey, hash, ec_sig_from_der(der));
            } catch (const user_error&) {
                return false; // Malformed DER
            }
        }

        static size_t find_input(const Tx& tx, const coin_sign_data& coin)
        {
            for (size_t i = 0; i < tx.get_num_inputs(); ++i) {
                if (tx.get_input_vout(i) == coin.vout && tx.get_input_txid(i) == coin.txid) {
                    return i;
                }
            }
            throw user_error("Signing data does not match any transaction input");
        }

        static std::optional<size_t> find_coin(const Tx& tx, size_t index, const std::vector<coin_sign_data>& coins)
        {
            const auto txid = tx.get_input_txid(index);
            const auto vout = tx.get_input_vout(index);
            const auto p = std::find_if(coins.begin(), coins.end(),
                [&txid, vout](const auto& coin) { return coin.vout == vout && coin.txid == txid; });
            if (p == coins.end()) {
                return {};
            }
            return static_cast<size_t>(p - coins.begin());
        }

        // Sorted co-signer public keys at path
        static std::vector<pub_key_t> derive_public_keys(
            const account& acc, bool is_main_net, const std::vector<uint32_t>& path)
        {
            std::vector<pub_key_t> ret;
            for (const auto& key : acc.keys) {
                const auto hdkey = bip32_key_from_base58(key);
                SPVD_USER_ASSERT(bip32_key_is_main_net(*hdkey) == is_main_net, "Account key is for a different network");
                ret.push_back(bip32_public_key(*bip32_key_from_parent_path(*hdkey, path, DERIVE_PUBLIC)));
            }
            std::sort(ret.begin(), ret.end());
            return ret;
        }

        static std::vector<unsigned char> multisig_redeem_script(uint32_t threshold, const std::vector<pub_key_t>& keys)
        {
            std::vector<unsigned char> concatenated;
            concatenated.reserve(keys.size() * EC_PUBLIC_KEY_LEN);
            for (const auto& key : keys) {
                concatenated.insert(concatenated.end(), key.begin(), key.end());
            }
            return scriptpubkey_multisig_from_bytes(concatenated, threshold);
        }

        static std::vector<unsigned char> p2sh_script(byte_span_t redeem_script)
        {
            return scriptpubkey_p2sh_from_hash160(hash160(redeem_script));
        }

        // Signatures already present in a p2sh multisig scriptSig for redeem_script
        static std::vector<std::vector<unsigned char>> get_existing_sigs(
            byte_span_t script_sig, const std::vector<unsigned char>& redeem_script)
        {
            if (script_sig.empty()) {
                return {};
            }
            auto pushes = script_get_pushes(script_sig);
            if (pushes.size() < 2 || pushes.back() != redeem_script) {
                // Not signed for this script: replace it
                return {};
            }
            std::vector<std::vector<unsigned char>> ret;
            for (size_t i = 1; i + 1 < pushes.size(); ++i) {
                if (!pushes[i].empty()) {
                    ret.emplace_back(std::move(pushes[i]));
                }
            }
            return ret;
        }

        static void sign_multisig_input(const account& acc, bool is_main_net, Tx& tx, size_t index,
            const coin_sign_data& coin, const ext_key& signing_key)
        {
            const auto pubkeys = derive_public_keys(acc, is_main_net, coin.path);
            const auto our_pubkey = bip32_public_key(signing_key);
            SPVD_USER_ASSERT(std::binary_search(pubkeys.begin(), pubkeys.end(), our_pubkey),
                "Signing key does not belong to this account");

            const auto redeem_script = multisig_redeem_script(acc.type.required, pubkeys);
            SPVD_USER_ASSERT(p2sh_script(redeem_script) == h2b(coin.script), "Signing data does not match the account keys");

            const auto hash = tx.get_signature_hash(index, redeem_script);
            std::map<pub_key_t, std::vector<unsigned char>> sigs;
            for (auto& der : get_existing_sigs(tx.get_input_script(index), redeem_script)) {
                for (const auto& pubkey : pubkeys) {
                    if (signature_matches(pubkey, hash, der)) {
                        sigs[pubkey] = std::move(der);
                        break;
                    }
                }
            }
            sigs[our_pubkey] = ec_sig_to_der(ec_sig_from_bytes(bip32_private_key(signing_key), hash));

            // OP_0 <sig>... <redeem script>, signatures in key order
            std::vector<unsigned char> script_sig{ OP_0 };
            uint32_t num_sigs = 0;
            for (const auto& pubkey : pubkeys) {
                const auto p = sigs.find(pubkey);
                if (p != sigs.end() && num_sigs < acc.type.required) {
                    const auto push = script_push_from_bytes(p->second);
                    script_sig.insert(script_sig.end(), push.begin(), push.end());
                    ++num_sigs;
                }
            }
            const auto push = script_push_from_bytes(redeem_script);
            script_sig.insert(script_sig.end(), push.begin(), push.end());
            tx.set_input_script(index, script_sig);
        }

        static void sign_p2pkh_input(Tx& tx, size_t index, const coin_sign_data& coin, const ext_key& signing_key)
        {
            const auto pubkey = bip32_public_key(signing_key);
            const auto script = h2b(coin.script);
            SPVD_USER_ASSERT(scriptpubkey_p2pkh_from_public_key(pubkey) == script,
                "Signing data does not match the account key");
            const auto hash = tx.get_signature_hash(index, script);
            const auto der = ec_sig_to_der(ec_sig_from_bytes(bip32_private_key(signing_key), hash));
            tx.set_input_script(index, scriptsig_p2pkh_from_der(pubkey, der));
        }

        static bool verify_p2pkh_input(const std::vector<std::vector<unsigned char>>& pushes, byte_span_t script,
            const std::array<unsigned char, SHA256_LEN>& hash)
        {
            if (pushes.size() != 2 || pushes[1].size() != EC_PUBLIC_KEY_LEN) {
                return false;
            }
            pub_key_t pubkey;
            std::copy(pushes[1].begin(), pushes[1].end(), pubkey.begin());
            const auto expected = scriptpubkey_p2pkh_from_public_key(pubkey);
            return std::equal(expected.begin(), expected.end(), script.begin(), script.end())
                && signature_matches(pubkey, hash, pushes[0]);
        }

        static bool verify_multisig_input(
            const Tx& tx, size_t index, const std::vector<std::vector<unsigned char>>& pushes, byte_span_t script)
        {
            if (pushes.size() < 2 || !pushes.front().empty()) {
                return false;
            }
            const auto& redeem_script = pushes.back();
            const auto expected = p2sh_script(redeem_script);
            if (!std::equal(expected.begin(), expected.end(), script.begin(), script.end())) {
                return false;
            }
            const auto multisig = parse_multisig(redeem_script);
            if (!multisig) {
                return false;
            }
            const auto hash = tx.get_signature_hash(index, redeem_script);

            // Signatures must appear in the same order as their keys
            uint32_t valid = 0;
            size_t key_index = 0;
            for (size_t i = 1; i + 1 < pushes.size(); ++i) {
                while (key_index < multisig->pubkeys.size()
                    && !signature_matches(multisig->pubkeys[key_index], hash, pushes[i])) {
                    ++key_index;
                }
                if (key_index == multisig->pubkeys.size()) {
                    return false;
                }
                ++valid;
                ++key_index;
            }
            return valid >= multisig->threshold;
        }
    } // namespace

    void sign_offline_tx(const account& acc, const std::optional<std::string>& master, bool is_main_net, Tx& tx,
        const std::vector<coin_sign_data>& coins)
    {
        SPVD_USER_ASSERT(acc.is_complete(), "Account is not complete");
        const auto& master_key = master ? master : acc.master;
        SPVD_USER_ASSERT(master_key.has_value(), "No private key available to sign the transaction");
        const auto xprv = bip32_key_from_base58(*master_key);
        SPVD_USER_ASSERT(bip32_key_is_private(*xprv), "Signing key must be an extended private key");
        SPVD_USER_ASSERT(bip32_key_is_main_net(*xprv) == is_main_net, "Signing key is for a different network");

        for (const auto& coin : coins) {
            const size_t index = find_input(tx, coin);
            const auto signing_key = bip32_key_from_parent_path(*xprv, coin.path, DERIVE_PRIVATE);
            if (acc.type.multisig) {
                sign_multisig_input(acc, is_main_net, tx, index, coin, *signing_key);
            } else {
                sign_p2pkh_input(tx, index, coin, *signing_key);
            }
        }
    }

    bool verify_std_tx(const Tx& tx, const std::vector<coin_sign_data>& coins)
    {
        for (size_t i = 0; i < tx.get_num_inputs(); ++i) {
            const auto coin_index = find_coin(tx, i, coins);
            if (!coin_index) {
                SPVD_LOG_SEV(log_level::debug) << "no signing data for input " << i;
                return false;
            }
            const auto script = h2b(coins[*coin_index].script);
            std::vector<std::vector<unsigned char>> pushes;
            try {
                pushes = script_get_pushes(tx.get_input_script(i));
            } catch (const user_error&) {
                return false; // Non-standard scriptSig
            }

            bool verified = false;
            switch (scriptpubkey_get_type(script)) {
            case WALLY_SCRIPT_TYPE_P2PKH:
                verified = verify_p2pkh_input(pushes, script, tx.get_signature_hash(i, script));
                break;
            case WALLY_SCRIPT_TYPE_P2SH:
                verified = verify_multisig_input(tx, i, pushes, script);
                break;
            default:
                break;
            }
            if (!verified) {
                return false;
            }
        }
        return true;
    }

} // namespace spvd
