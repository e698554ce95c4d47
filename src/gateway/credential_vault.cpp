#include "gateway/credential_vault.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <nlohmann/json.hpp>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

const int kIvSize = 16;

typedef std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> CipherCtx;

CipherCtx newCipherCtx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

std::string toBase64(const std::vector<unsigned char>& bytes) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, BIO_new(BIO_s_mem()));
    BIO_write(b64, bytes.data(), (int)bytes.size());
    (void)BIO_flush(b64);

    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(b64, &mem);
    std::string encoded(mem->data, mem->length);
    BIO_free_all(b64);
    return encoded;
}

std::vector<unsigned char> fromBase64(const std::string& encoded) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* chain = BIO_push(b64, BIO_new_mem_buf(encoded.data(), (int)encoded.size()));

    std::vector<unsigned char> out(encoded.size());
    int n = BIO_read(chain, out.data(), (int)out.size());
    out.resize(n > 0 ? n : 0);
    BIO_free_all(chain);
    return out;
}

// single SHA-256 of the passphrase => 32 byte AES key
std::vector<unsigned char> keyFromPassphrase(const std::string& passphrase) {
    std::vector<unsigned char> key(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)passphrase.data(), passphrase.size(), key.data());
    return key;
}

std::string readWholeFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string trimRight(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // anonymous namespace

namespace CredentialVault {

std::string sealSecret(const std::string& passphrase, const std::string& plaintext) {
    auto key = keyFromPassphrase(passphrase);

    unsigned char iv[kIvSize];
    if (!RAND_bytes(iv, kIvSize)) {
        throw std::runtime_error("Failed to generate IV");
    }

    CipherCtx ctx = newCipherCtx();
    if (1 != EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv)) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }

    // iv first, ciphertext after it
    std::vector<unsigned char> sealed(iv, iv + kIvSize);
    sealed.resize(kIvSize + plaintext.size() + kIvSize);

    int len1 = 0;
    if (1 != EVP_EncryptUpdate(ctx.get(), sealed.data() + kIvSize, &len1,
                               (const unsigned char*)plaintext.data(), (int)plaintext.size())) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    int len2 = 0;
    if (1 != EVP_EncryptFinal_ex(ctx.get(), sealed.data() + kIvSize + len1, &len2)) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    sealed.resize(kIvSize + len1 + len2);

    return toBase64(sealed);
}

std::string openSecret(const std::string& passphrase, const std::string& sealed) {
    auto bytes = fromBase64(trimRight(sealed));
    if (bytes.size() <= (size_t)kIvSize) {
        throw std::runtime_error("Sealed data too short, missing IV or ciphertext");
    }
    unsigned char iv[kIvSize];
    std::memcpy(iv, bytes.data(), kIvSize);

    auto key = keyFromPassphrase(passphrase);
    CipherCtx ctx = newCipherCtx();
    if (1 != EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv)) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }

    size_t cipherLen = bytes.size() - kIvSize;
    std::vector<unsigned char> plain(cipherLen + kIvSize);
    int len1 = 0;
    if (1 != EVP_DecryptUpdate(ctx.get(), plain.data(), &len1,
                               bytes.data() + kIvSize, (int)cipherLen)) {
        throw std::runtime_error("EVP_DecryptUpdate failed");
    }
    int len2 = 0;
    if (1 != EVP_DecryptFinal_ex(ctx.get(), plain.data() + len1, &len2)) {
        throw std::runtime_error("EVP_DecryptFinal_ex failed - possibly wrong passphrase");
    }
    plain.resize(len1 + len2);

    return std::string((const char*)plain.data(), plain.size());
}

void writeGatewayCredentials(const GatewayCredentials& creds,
                             const std::string& passphrase,
                             const std::string& outputFilePath)
{
    nlohmann::json j;
    j["apiKey"]    = creds.apiKey;
    j["secretKey"] = creds.secretKey;

    std::string sealed = sealSecret(passphrase, j.dump());

    std::ofstream out(outputFilePath);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to write to " + outputFilePath);
    }
    out << sealed;
    if (!out) {
        throw std::runtime_error("Failed to write to " + outputFilePath);
    }
}

GatewayCredentials readGatewayCredentials(const std::string& keysFile,
                                          const std::string& passphraseFile)
{
    std::string passphrase = readWholeFile(passphraseFile);
    passphrase = trimRight(passphrase.substr(0, passphrase.find('\n')));
    if (passphrase.empty()) {
        throw std::runtime_error("Passphrase file " + passphraseFile + " is empty");
    }

    std::string plain = openSecret(passphrase, readWholeFile(keysFile));

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(plain);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Decrypted credentials are not JSON: " + std::string(e.what()));
    }

    GatewayCredentials creds;
    creds.apiKey    = j.value("apiKey", "");
    creds.secretKey = j.value("secretKey", "");
    if (creds.apiKey.empty() || creds.secretKey.empty()) {
        throw std::runtime_error("Credentials file " + keysFile + " lacks apiKey or secretKey");
    }
    return creds;
}

} // namespace CredentialVault
