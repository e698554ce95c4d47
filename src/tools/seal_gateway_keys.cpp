#include "gateway/credential_vault.hpp"
#include <iostream>

int main(int argc, char** argv) {
    std::string output = (argc > 1) ? argv[1] : "config/gateway_keys.enc";
    GatewayCredentials creds;
    std::string passphrase;

    std::cout << "Enter the payment gateway API key: ";
    std::getline(std::cin, creds.apiKey);

    std::cout << "Enter the payment gateway secret key: ";
    std::getline(std::cin, creds.secretKey);

    std::cout << "Enter a passphrase to seal them with: ";
    std::getline(std::cin, passphrase);

    if (creds.apiKey.empty() || creds.secretKey.empty() || passphrase.empty()) {
        std::cerr << "API key, secret key and passphrase must all be non-empty.\n";
        return 1;
    }

    try {
        CredentialVault::writeGatewayCredentials(creds, passphrase, output);
    } catch (const std::exception& e) {
        std::cerr << "Failed to seal keys: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Sealed gateway keys saved to " << output << "\n";
    return 0;
}
