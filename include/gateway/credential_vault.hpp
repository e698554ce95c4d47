#ifndef CREDENTIAL_VAULT_HPP
#define CREDENTIAL_VAULT_HPP

#include <string>

struct GatewayCredentials {
    std::string apiKey;
    std::string secretKey;
};

namespace CredentialVault {

/**
 * Encrypts plaintext under passphrase with AES-256-CBC.
 * Returns base64 of (iv + ciphertext).
 */
std::string sealSecret(const std::string& passphrase,
                       const std::string& plaintext);

/**
 * Reverses sealSecret. Throws std::runtime_error on malformed input or a
 * wrong passphrase.
 */
std::string openSecret(const std::string& passphrase,
                       const std::string& sealed);

// Writes {"apiKey","secretKey"} sealed under passphrase to outputFilePath.
void writeGatewayCredentials(const GatewayCredentials& creds,
                             const std::string& passphrase,
                             const std::string& outputFilePath);

// Reads the passphrase file (first line), then opens keysFile with it.
GatewayCredentials readGatewayCredentials(const std::string& keysFile,
                                          const std::string& passphraseFile);

} // namespace CredentialVault

#endif // CREDENTIAL_VAULT_HPP
