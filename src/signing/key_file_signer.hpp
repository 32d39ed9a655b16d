#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include "signing/signer.hpp"

namespace stepgate::signing {

// Signs results with a PEM private key and its PEM certificate (the SVID),
// as dropped on disk by a workload-identity agent.
class KeyFileSigner : public Signer {
public:
    static core::errors::Result<std::shared_ptr<KeyFileSigner>> load(
        const std::filesystem::path& key_path, const std::filesystem::path& cert_path);

    core::errors::Result<std::vector<protocol::RunResult>> sign(
        const std::vector<protocol::RunResult>& results) override;

    // Checks every <key>.sig, the manifest and the SVID in a signed record.
    core::errors::Status verify(const std::vector<protocol::RunResult>& entries) const;

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };
    struct X509Deleter {
        void operator()(X509* cert) const { X509_free(cert); }
    };

    KeyFileSigner(std::unique_ptr<EVP_PKEY, PkeyDeleter> key,
                  std::unique_ptr<X509, X509Deleter> cert, std::string cert_pem);

    core::errors::Result<std::string> sign_value(const std::string& value) const;
    bool verify_value(const std::string& value, const std::string& signature_b64) const;

    std::unique_ptr<EVP_PKEY, PkeyDeleter> key_;
    std::unique_ptr<X509, X509Deleter> cert_;
    std::string cert_pem_;
};

// Comma-joined sorted keys of the signed results.
std::string result_manifest(const std::vector<protocol::RunResult>& results);

}  // namespace stepgate::signing
