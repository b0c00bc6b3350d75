#include "ca_bundle.hpp"
#include "check_config.hpp"
#include <spdlog/spdlog.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <fstream>
#include <sstream>
#include <cstring>

std::shared_ptr<const CaBundle> CaBundle::load_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("error reading root certificate: cannot open " + path);
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    std::string pem = ss.str();
    if (pem.empty()) {
        throw ConfigError("error reading root certificate: " + path + " is empty");
    }

    auto bundle = from_pem(pem);
    spdlog::debug("Loaded {} CA certificates from {}", bundle->size(), path);
    return bundle;
}

std::shared_ptr<const CaBundle> CaBundle::from_pem(const std::string& pem) {
    auto bundle = std::make_shared<CaBundle>();

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        throw ConfigError("error parsing root certificate: out of memory");
    }

    // Walk every PEM block; blocks that are not certificates, or that fail
    // to decode, are skipped rather than aborting the whole bundle.
    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;
    while (PEM_read_bio(bio.get(), &name, &header, &data, &len) == 1) {
        if (std::strcmp(name, PEM_STRING_X509) == 0 && header[0] == '\0') {
            const unsigned char* p = data;
            X509* cert = d2i_X509(nullptr, &p, len);
            if (cert) {
                bundle->certs_.emplace_back(cert);
            }
        }
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
        name = nullptr;
        header = nullptr;
        data = nullptr;
    }
    // The loop always ends on PEM_R_NO_START_LINE
    ERR_clear_error();

    if (bundle->certs_.empty()) {
        throw ConfigError("error parsing root certificate: no PEM certificate found");
    }
    return bundle;
}

void CaBundle::install(X509_STORE* store) const {
    for (const auto& cert : certs_) {
        if (X509_STORE_add_cert(store, cert.get()) != 1) {
            unsigned long err = ERR_peek_last_error();
            if (ERR_GET_REASON(err) != X509_R_CERT_ALREADY_IN_HASH_TABLE) {
                char buf[256];
                ERR_error_string_n(err, buf, sizeof(buf));
                spdlog::warn("Failed to add CA certificate to trust store: {}", buf);
            }
            ERR_clear_error();
        }
    }
}
