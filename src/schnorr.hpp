#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

// BIP-340 Schnorr signatures over secp256k1. Keys, messages and
// signatures are lowercase hex: 32-byte secret keys, 32-byte x-only
// public keys, 32-byte messages and 64-byte signatures.
namespace schnorr
{

E<std::string> publicKeyFor(std::string_view secret_hex);

// With an empty aux, 32 random bytes are used.
E<std::string> sign(std::string_view secret_hex, std::string_view msg_hex,
                    const std::vector<unsigned char>& aux = {});

bool verify(std::string_view pubkey_hex, std::string_view msg_hex,
            std::string_view sig_hex);

// Reduces a 32-byte seed modulo the curve order into a valid secret
// key.
E<std::string> secretFromSeed(const std::vector<unsigned char>& seed);

E<std::string> generateSecret();

} // namespace schnorr
