#ifndef SPVD_WALLY_HPP
#define SPVD_WALLY_HPP
#pragma once

#include <array>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "gsl_wrapper.hpp"
#include "include/wally_wrapper.h"

#include "assertion.hpp"

namespace std {
template <> struct default_delete<struct ext_key> {
    void operator()(struct ext_key* ptr) const { ::bip32_key_free(ptr); }
};

template <> struct default_delete<struct wally_tx> {
    void operator()(struct wally_tx* ptr) const { wally_tx_free(ptr); }
};
} // namespace std

namespace spvd {
    using wally_ext_key_ptr = std::unique_ptr<struct ext_key>;
    using wally_tx_ptr = std::unique_ptr<struct wally_tx>;

    using byte_span_t = gsl::span<const unsigned char>;
    using uint32_span_t = gsl::span<const uint32_t>;

    using ecdsa_sig_t = std::array<unsigned char, EC_SIGNATURE_LEN>;
    using pub_key_t = std::array<unsigned char, EC_PUBLIC_KEY_LEN>;
    using priv_key_t = std::array<unsigned char, EC_PRIVATE_KEY_LEN>;

    struct wally_string_dtor {
        void operator()(char* p) { wally_free_string(p); }
    };
    using wally_string_ptr = std::unique_ptr<char, wally_string_dtor>;
    inline std::string make_string(char* p) { return std::string(wally_string_ptr(p).get()); }

    //
    // Hashing
    //
    std::array<unsigned char, HASH160_LEN> hash160(byte_span_t data);

    std::array<unsigned char, SHA512_LEN> sha512(byte_span_t data);

    //
    // BIP 32
    //
    // Parse a base58 extended key; throws user_error if it is malformed
    wally_ext_key_ptr bip32_key_from_base58(const std::string& base58);

    wally_ext_key_ptr bip32_key_from_seed(byte_span_t seed, uint32_t version, uint32_t flags);

    wally_ext_key_ptr bip32_key_from_parent_path(const ext_key& parent, uint32_span_t path, uint32_t flags);

    std::string bip32_key_to_base58(const ext_key& hdkey, uint32_t flags);

    bool bip32_key_is_private(const ext_key& hdkey);

    bool bip32_key_is_main_net(const ext_key& hdkey);

    pub_key_t bip32_public_key(const ext_key& hdkey);

    priv_key_t bip32_private_key(const ext_key& hdkey);

    //
    // Scripts
    //
    std::vector<unsigned char> scriptsig_p2pkh_from_der(byte_span_t public_key, byte_span_t sig);

    std::vector<unsigned char> scriptpubkey_p2pkh_from_public_key(byte_span_t public_key);

    std::vector<unsigned char> scriptpubkey_p2sh_from_hash160(byte_span_t hash);

    // Bare m-of-n script over concatenated compressed public keys, in the order given
    std::vector<unsigned char> scriptpubkey_multisig_from_bytes(byte_span_t keys, uint32_t threshold);

    uint32_t scriptpubkey_get_type(byte_span_t scriptpubkey);

    std::vector<unsigned char> script_push_from_bytes(byte_span_t data);

    // Split a push-only script (e.g. a scriptSig) into its pushed items.
    // OP_0 yields an empty item. Throws user_error for non-push opcodes.
    std::vector<std::vector<unsigned char>> script_get_pushes(byte_span_t script);

    //
    // Strings
    //
    std::string b2h(byte_span_t data);
    std::string b2h_rev(byte_span_t data);

    std::vector<unsigned char> h2b(const std::string& hex);
    std::vector<unsigned char> h2b_rev(const std::string& hex);

    //
    // Signing
    //
    ecdsa_sig_t ec_sig_from_bytes(
        byte_span_t private_key, byte_span_t hash, uint32_t flags = EC_FLAG_ECDSA | EC_FLAG_GRIND_R);

    // DER encoding with the sighash byte appended
    std::vector<unsigned char> ec_sig_to_der(byte_span_t sig, uint32_t sighash_flags = WALLY_SIGHASH_ALL);

    // Decode a DER signature that carries a trailing sighash byte
    ecdsa_sig_t ec_sig_from_der(byte_span_t der);

    bool ec_sig_verify(
        byte_span_t public_key, byte_span_t message_hash, byte_span_t sig, uint32_t flags = EC_FLAG_ECDSA);

    //
    // Transactions
    //
    class Tx {
    public:
        explicit Tx(const std::string& tx_hex);

        Tx(Tx&& rhs) = default;
        Tx(const Tx& rhs) = delete;
        Tx& operator=(const Tx& rhs) = delete;

        std::string to_hex() const;

        size_t get_num_inputs() const { return m_tx->num_inputs; }
        const struct wally_tx_input& get_input(size_t index) const;

        // Previous output txid (display order) and index spent by an input
        std::string get_input_txid(size_t index) const;
        uint32_t get_input_vout(size_t index) const { return get_input(index).index; }

        std::vector<unsigned char> get_input_script(size_t index) const;
        void set_input_script(size_t index, byte_span_t script);

        // Legacy (pre-segwit) SIGHASH_ALL hash of an input against its script code
        std::array<unsigned char, SHA256_LEN> get_signature_hash(size_t index, byte_span_t script) const;

    private:
        wally_tx_ptr m_tx;
    };

} // namespace spvd

#endif
