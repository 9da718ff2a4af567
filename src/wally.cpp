#include <algorithm>

#include "exception.hpp"
#include "wally.hpp"

namespace spvd {

    std::array<unsigned char, HASH160_LEN> hash160(byte_span_t data)
    {
        std::array<unsigned char, HASH160_LEN> ret;
        SPVD_VERIFY(wally_hash160(data.data(), data.size(), ret.data(), ret.size()));
        return ret;
    }

    std::array<unsigned char, SHA512_LEN> sha512(byte_span_t data)
    {
        std::array<unsigned char, SHA512_LEN> ret;
        SPVD_VERIFY(wally_sha512(data.data(), data.size(), ret.data(), ret.size()));
        return ret;
    }

    //
    // BIP 32
    //
    wally_ext_key_ptr bip32_key_from_base58(const std::string& base58)
    {
        ext_key* p;
        if (::bip32_key_from_base58_alloc(base58.c_str(), &p) != WALLY_OK) {
            throw user_error("Invalid extended key");
        }
        return wally_ext_key_ptr{ p };
    }

    wally_ext_key_ptr bip32_key_from_seed(byte_span_t seed, uint32_t version, uint32_t flags)
    {
        ext_key* p;
        SPVD_VERIFY(::bip32_key_from_seed_alloc(seed.data(), seed.size(), version, flags, &p));
        return wally_ext_key_ptr{ p };
    }

    wally_ext_key_ptr bip32_key_from_parent_path(const ext_key& parent, uint32_span_t path, uint32_t flags)
    {
        SPVD_RUNTIME_ASSERT(!path.empty());
        ext_key* p;
        SPVD_VERIFY(::bip32_key_from_parent_path_alloc(&parent, path.data(), path.size(), flags, &p));
        return wally_ext_key_ptr{ p };
    }

    std::string bip32_key_to_base58(const ext_key& hdkey, uint32_t flags)
    {
        char* s;
        SPVD_VERIFY(::bip32_key_to_base58(&hdkey, flags, &s));
        return make_string(s);
    }

    bool bip32_key_is_private(const ext_key& hdkey)
    {
        return hdkey.version == BIP32_VER_MAIN_PRIVATE || hdkey.version == BIP32_VER_TEST_PRIVATE;
    }

    bool bip32_key_is_main_net(const ext_key& hdkey)
    {
        return hdkey.version == BIP32_VER_MAIN_PRIVATE || hdkey.version == BIP32_VER_MAIN_PUBLIC;
    }

    pub_key_t bip32_public_key(const ext_key& hdkey)
    {
        pub_key_t ret;
        std::copy(hdkey.pub_key, hdkey.pub_key + ret.size(), ret.begin());
        return ret;
    }

    priv_key_t bip32_private_key(const ext_key& hdkey)
    {
        SPVD_RUNTIME_ASSERT(bip32_key_is_private(hdkey));
        // Skip the leading prefix byte
        priv_key_t ret;
        std::copy(hdkey.priv_key + 1, hdkey.priv_key + 1 + ret.size(), ret.begin());
        return ret;
    }

    //
    // Scripts
    //
    std::vector<unsigned char> scriptsig_p2pkh_from_der(byte_span_t public_key, byte_span_t sig)
    {
        std::vector<unsigned char> out(2 + public_key.size() + 2 + sig.size());
        size_t written;
        SPVD_VERIFY(wally_scriptsig_p2pkh_from_der(
            public_key.data(), public_key.size(), sig.data(), sig.size(), out.data(), out.size(), &written));
        SPVD_RUNTIME_ASSERT(written <= out.size());
        out.resize(written);
        return out;
    }

    std::vector<unsigned char> scriptpubkey_p2pkh_from_public_key(byte_span_t public_key)
    {
        const auto hash = hash160(public_key);
        size_t written;
        std::vector<unsigned char> ret(WALLY_SCRIPTPUBKEY_P2PKH_LEN);
        SPVD_VERIFY(wally_scriptpubkey_p2pkh_from_bytes(hash.data(), hash.size(), 0, &ret[0], ret.size(), &written));
        SPVD_RUNTIME_ASSERT(written == WALLY_SCRIPTPUBKEY_P2PKH_LEN);
        return ret;
    }

    std::vector<unsigned char> scriptpubkey_p2sh_from_hash160(byte_span_t hash)
    {
        SPVD_RUNTIME_ASSERT(hash.size() == HASH160_LEN);
        size_t written;
        std::vector<unsigned char> ret(WALLY_SCRIPTPUBKEY_P2SH_LEN);
        SPVD_VERIFY(wally_scriptpubkey_p2sh_from_bytes(hash.data(), hash.size(), 0, &ret[0], ret.size(), &written));
        SPVD_RUNTIME_ASSERT(written == WALLY_SCRIPTPUBKEY_P2SH_LEN);
        return ret;
    }

    std::vector<unsigned char> scriptpubkey_multisig_from_bytes(byte_span_t keys, uint32_t threshold)
    {
        // OP_m + n * (push + key) + OP_n + OP_CHECKMULTISIG
        std::vector<unsigned char> out(3 + keys.size() / EC_PUBLIC_KEY_LEN * (EC_PUBLIC_KEY_LEN + 1));
        const uint32_t flags = 0;
        size_t written;
        SPVD_VERIFY(wally_scriptpubkey_multisig_from_bytes(
            keys.data(), keys.size(), threshold, flags, &out[0], out.size(), &written));
        SPVD_RUNTIME_ASSERT(written <= out.size());
        out.resize(written);
        return out;
    }

    uint32_t scriptpubkey_get_type(byte_span_t scriptpubkey)
    {
        size_t typ;
        if (wally_scriptpubkey_get_type(scriptpubkey.data(), scriptpubkey.size(), &typ) != WALLY_OK) {
            return WALLY_SCRIPT_TYPE_UNKNOWN;
        }
        return static_cast<uint32_t>(typ);
    }

    std::vector<unsigned char> script_push_from_bytes(byte_span_t data)
    {
        std::vector<unsigned char> ret(data.size() + 5); // 5 = OP_PUSHDATA4 + 4 byte size
        const uint32_t flags = 0;
        size_t written;
        SPVD_VERIFY(wally_script_push_from_bytes(data.data(), data.size(), flags, &ret[0], ret.size(), &written));
        SPVD_RUNTIME_ASSERT(written <= ret.size());
        ret.resize(written);
        return ret;
    }

    std::vector<std::vector<unsigned char>> script_get_pushes(byte_span_t script)
    {
        std::vector<std::vector<unsigned char>> ret;
        size_t pos = 0;
        const auto read_le = [&script, &pos](size_t n) {
            SPVD_USER_ASSERT(pos + n <= script.size(), "Invalid input script");
            size_t len = 0;
            for (size_t i = 0; i < n; ++i) {
                len |= static_cast<size_t>(script[pos + i]) << (8 * i);
            }
            pos += n;
            return len;
        };

        while (pos < script.size()) {
            const unsigned char opcode = script[pos++];
            size_t len;
            if (opcode == OP_0) {
                ret.emplace_back();
                continue;
            } else if (opcode < OP_PUSHDATA1) {
                len = opcode;
            } else if (opcode == OP_PUSHDATA1) {
                len = read_le(1);
            } else if (opcode == OP_PUSHDATA2) {
                len = read_le(2);
            } else if (opcode == OP_PUSHDATA4) {
                len = read_le(4);
            } else {
                throw user_error("Invalid input script");
            }
            SPVD_USER_ASSERT(len <= script.size() - pos, "Invalid input script");
            ret.emplace_back(script.begin() + pos, script.begin() + pos + len);
            pos += len;
        }
        return ret;
    }

    //
    // Strings
    //
    std::string b2h(byte_span_t data)
    {
        char* ret;
        SPVD_VERIFY(wally_hex_from_bytes(data.data(), data.size(), &ret));
        return make_string(ret);
    }

    std::string b2h_rev(byte_span_t data)
    {
        std::vector<unsigned char> buff(data.rbegin(), data.rend());
        return b2h(buff);
    }

    static auto h2b(const std::string& hex, bool rev)
    {
        if (hex.empty()) {
            return std::vector<unsigned char>();
        }
        size_t written;
        std::vector<unsigned char> buff(hex.size() / 2);
        if (hex.size() % 2 != 0 || wally_hex_to_bytes(hex.c_str(), buff.data(), buff.size(), &written) != WALLY_OK) {
            throw user_error("Invalid hex string");
        }
        SPVD_RUNTIME_ASSERT(written == buff.size());
        if (rev) {
            std::reverse(buff.begin(), buff.end());
        }
        return buff;
    }

    std::vector<unsigned char> h2b(const std::string& hex) { return h2b(hex, false); }

    std::vector<unsigned char> h2b_rev(const std::string& hex) { return h2b(hex, true); }

    //
    // Signing
    //
    ecdsa_sig_t ec_sig_from_bytes(byte_span_t private_key, byte_span_t hash, uint32_t flags)
    {
        ecdsa_sig_t ret;
        SPVD_VERIFY(wally_ec_sig_from_bytes(
            private_key.data(), private_key.size(), hash.data(), hash.size(), flags, ret.data(), ret.size()));
        return ret;
    }

    std::vector<unsigned char> ec_sig_to_der(byte_span_t sig, uint32_t sighash_flags)
    {
        std::vector<unsigned char> der(EC_SIGNATURE_DER_MAX_LEN + 1);
        size_t written;
        SPVD_VERIFY(wally_ec_sig_to_der(sig.data(), sig.size(), der.data(), der.size(), &written));
        SPVD_RUNTIME_ASSERT(written <= der.size());
        der.resize(written);
        der.push_back(static_cast<unsigned char>(sighash_flags));
        return der;
    }

    ecdsa_sig_t ec_sig_from_der(byte_span_t der)
    {
        ecdsa_sig_t sig;
        int ret = WALLY_EINVAL;
        if (der.size() > 1) {
            ret = wally_ec_sig_from_der(der.data(), der.size() - 1, sig.data(), sig.size());
        }
        if (ret != WALLY_OK) {
            throw user_error("Invalid signature");
        }
        return sig;
    }

    bool ec_sig_verify(byte_span_t public_key, byte_span_t message_hash, byte_span_t sig, uint32_t flags)
    {
        return wally_ec_sig_verify(public_key.data(), public_key.size(), message_hash.data(), message_hash.size(),
                   flags, sig.data(), sig.size())
            == WALLY_OK;
    }

    //
    // Transactions
    //
    Tx::Tx(const std::string& tx_hex)
    {
        struct wally_tx* p;
        if (tx_hex.empty() || wally_tx_from_hex(tx_hex.c_str(), WALLY_TX_FLAG_USE_WITNESS, &p) != WALLY_OK) {
            throw user_error("Invalid transaction");
        }
        m_tx.reset(p);
    }

    std::string Tx::to_hex() const
    {
        char* ret;
        SPVD_VERIFY(wally_tx_to_hex(m_tx.get(), WALLY_TX_FLAG_USE_WITNESS, &ret));
        return make_string(ret);
    }

    const struct wally_tx_input& Tx::get_input(size_t index) const
    {
        SPVD_RUNTIME_ASSERT(index < m_tx->num_inputs);
        return m_tx->inputs[index];
    }

    std::string Tx::get_input_txid(size_t index) const
    {
        const auto& input = get_input(index);
        return b2h_rev({ input.txhash, WALLY_TXHASH_LEN });
    }

    std::vector<unsigned char> Tx::get_input_script(size_t index) const
    {
        const auto& input = get_input(index);
        if (!input.script) {
            return {};
        }
        return { input.script, input.script + input.script_len };
    }

    void Tx::set_input_script(size_t index, byte_span_t script)
    {
        const unsigned char* data = script.size() ? script.data() : nullptr;
        SPVD_VERIFY(wally_tx_set_input_script(m_tx.get(), index, data, script.size()));
    }

    std::array<unsigned char, SHA256_LEN> Tx::get_signature_hash(size_t index, byte_span_t script) const
    {
        std::array<unsigned char, SHA256_LEN> ret;
        constexpr uint64_t satoshi = 0; // Unused for legacy signature hashes
        constexpr uint32_t flags = 0;
        SPVD_VERIFY(wally_tx_get_btc_signature_hash(m_tx.get(), index, script.data(), script.size(), satoshi,
            WALLY_SIGHASH_ALL, flags, ret.data(), ret.size()));
        return ret;
    }

} // namespace spvd
