#include "signing/key_file_signer.hpp"

#include <algorithm>
#include <map>
#include <utility>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include "core/fs/file_io.hpp"
#include "core/logging/logger.hpp"

namespace stepgate::signing {

using core::errors::ErrorCategory;
using core::errors::StepError;

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string openssl_error() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

StepError signing_error(const std::string& message, const std::string& code) {
    return StepError{ErrorCategory::Internal, message, code, openssl_error()};
}

// Ed25519/Ed448 sign the message directly; everything else hashes with SHA-256.
const EVP_MD* digest_for(EVP_PKEY* key) {
    const int id = EVP_PKEY_id(key);
    if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) {
        return nullptr;
    }
    return EVP_sha256();
}

std::string base64_encode(const std::vector<unsigned char>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

bool base64_decode(const std::string& text, std::vector<unsigned char>& out) {
    if (text.empty() || text.size() % 4 != 0) {
        return false;
    }
    out.assign(3 * text.size() / 4, 0);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return false;
    }
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return true;
}

bool is_signer_entry(const protocol::RunResult& entry) {
    const auto& key = entry.key;
    const bool signature = key.size() >= kSignatureSuffix.size() &&
                           key.compare(key.size() - kSignatureSuffix.size(),
                                       kSignatureSuffix.size(), kSignatureSuffix) == 0;
    return signature || key == kResultManifestKey || key == kSvidKey;
}

StepError verification_error(const std::string& message) {
    return StepError{ErrorCategory::Internal, message, "signature_verification_failed"};
}

}  // namespace

std::string result_manifest(const std::vector<protocol::RunResult>& results) {
    std::vector<std::string> keys;
    keys.reserve(results.size());
    for (const auto& result : results) {
        keys.push_back(result.key);
    }
    std::sort(keys.begin(), keys.end());

    std::string manifest;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            manifest += ",";
        }
        manifest += keys[i];
    }
    return manifest;
}

KeyFileSigner::KeyFileSigner(std::unique_ptr<EVP_PKEY, PkeyDeleter> key,
                             std::unique_ptr<X509, X509Deleter> cert, std::string cert_pem)
    : key_(std::move(key)), cert_(std::move(cert)), cert_pem_(std::move(cert_pem)) {}

core::errors::Result<std::shared_ptr<KeyFileSigner>> KeyFileSigner::load(
    const std::filesystem::path& key_path, const std::filesystem::path& cert_path) {
    auto key_pem = core::fs::read_text_file(key_path);
    if (core::errors::is_error(key_pem)) {
        auto error = core::errors::get_error(key_pem);
        error.category = ErrorCategory::Configuration;
        error.code = "signing_key_unreadable";
        return error;
    }
    auto cert_pem = core::fs::read_text_file(cert_path);
    if (core::errors::is_error(cert_pem)) {
        auto error = core::errors::get_error(cert_pem);
        error.category = ErrorCategory::Configuration;
        error.code = "signing_cert_unreadable";
        return error;
    }

    const auto& key_text = core::errors::get_value(key_pem);
    std::unique_ptr<BIO, BioDeleter> key_bio(
        BIO_new_mem_buf(key_text.data(), static_cast<int>(key_text.size())));
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
        key_bio ? PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!key) {
        return signing_error("Unable to parse private key " + key_path.string(),
                             "invalid_signing_key");
    }

    const auto& cert_text = core::errors::get_value(cert_pem);
    std::unique_ptr<BIO, BioDeleter> cert_bio(
        BIO_new_mem_buf(cert_text.data(), static_cast<int>(cert_text.size())));
    std::unique_ptr<X509, X509Deleter> cert(
        cert_bio ? PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!cert) {
        return signing_error("Unable to parse certificate " + cert_path.string(),
                             "invalid_signing_cert");
    }

    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        return signing_error("Private key does not match certificate " + cert_path.string(),
                             "signing_key_mismatch");
    }

    return std::shared_ptr<KeyFileSigner>(
        new KeyFileSigner(std::move(key), std::move(cert), cert_text));
}

core::errors::Result<std::string> KeyFileSigner::sign_value(const std::string& value) const {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, digest_for(key_.get()), nullptr, key_.get()) != 1) {
        return signing_error("Unable to initialise signing context", "signing_failed");
    }

    const auto* data = reinterpret_cast<const unsigned char*>(value.data());
    std::size_t length = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &length, data, value.size()) != 1) {
        return signing_error("Unable to size signature", "signing_failed");
    }
    std::vector<unsigned char> signature(length);
    if (EVP_DigestSign(ctx.get(), signature.data(), &length, data, value.size()) != 1) {
        return signing_error("Unable to sign value", "signing_failed");
    }
    signature.resize(length);
    return base64_encode(signature);
}

bool KeyFileSigner::verify_value(const std::string& value,
                                 const std::string& signature_b64) const {
    std::vector<unsigned char> signature;
    if (!base64_decode(signature_b64, signature)) {
        return false;
    }

    std::unique_ptr<EVP_PKEY, PkeyDeleter> public_key(X509_get_pubkey(cert_.get()));
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!public_key || !ctx ||
        EVP_DigestVerifyInit(ctx.get(), nullptr, digest_for(public_key.get()), nullptr,
                             public_key.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    const int verified =
        EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                         reinterpret_cast<const unsigned char*>(value.data()), value.size());
    ERR_clear_error();
    return verified == 1;
}

core::errors::Result<std::vector<protocol::RunResult>> KeyFileSigner::sign(
    const std::vector<protocol::RunResult>& results) {
    std::vector<protocol::RunResult> signed_entries;
    for (const auto& result : results) {
        auto signature = sign_value(result.value);
        if (core::errors::is_error(signature)) {
            return core::errors::get_error(signature);
        }
        signed_entries.push_back({result.key + kSignatureSuffix,
                                  core::errors::get_value(signature),
                                  protocol::ResultType::TaskRunResult});
    }

    const auto manifest = result_manifest(results);
    auto manifest_signature = sign_value(manifest);
    if (core::errors::is_error(manifest_signature)) {
        return core::errors::get_error(manifest_signature);
    }
    signed_entries.push_back({kResultManifestKey, manifest, protocol::ResultType::TaskRunResult});
    signed_entries.push_back({kResultManifestKey + kSignatureSuffix,
                              core::errors::get_value(manifest_signature),
                              protocol::ResultType::TaskRunResult});
    signed_entries.push_back({kSvidKey, cert_pem_, protocol::ResultType::TaskRunResult});

    LOG_DEBUG("Signed " + std::to_string(results.size()) + " result(s)");
    return signed_entries;
}

core::errors::Status KeyFileSigner::verify(
    const std::vector<protocol::RunResult>& entries) const {
    std::map<std::string, std::string> values;
    std::vector<protocol::RunResult> results;
    for (const auto& entry : entries) {
        if (entry.result_type != protocol::ResultType::TaskRunResult) {
            continue;
        }
        values[entry.key] = entry.value;
        if (!is_signer_entry(entry)) {
            results.push_back(entry);
        }
    }

    const auto svid = values.find(kSvidKey);
    if (svid == values.end() || svid->second != cert_pem_) {
        return verification_error("SVID entry is missing or does not match the certificate");
    }

    const auto manifest = values.find(kResultManifestKey);
    const auto manifest_sig = values.find(kResultManifestKey + kSignatureSuffix);
    if (manifest == values.end() || manifest_sig == values.end()) {
        return verification_error("Result manifest or its signature is missing");
    }
    if (manifest->second != result_manifest(results)) {
        return verification_error("Result manifest does not list the signed results");
    }
    if (!verify_value(manifest->second, manifest_sig->second)) {
        return verification_error("Result manifest signature is invalid");
    }

    for (const auto& result : results) {
        const auto signature = values.find(result.key + kSignatureSuffix);
        if (signature == values.end()) {
            return verification_error("Result " + result.key + " is not signed");
        }
        if (!verify_value(result.value, signature->second)) {
            return verification_error("Signature of " + result.key + " is invalid");
        }
    }
    return core::errors::ok();
}

}  // namespace stepgate::signing
