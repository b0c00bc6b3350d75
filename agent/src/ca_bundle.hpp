#pragma once

#include <string>
#include <vector>
#include <memory>
#include <openssl/x509.h>

// Extra trust anchors appended to the system store of every TLS context
// a transport creates.
class CaBundle {
public:
    // Throws ConfigError when the file is unreadable, empty, or holds no
    // parseable certificate.
    static std::shared_ptr<const CaBundle> load_file(const std::string& path);
    static std::shared_ptr<const CaBundle> from_pem(const std::string& pem);

    size_t size() const { return certs_.size(); }
    void install(X509_STORE* store) const;

private:
    struct X509Deleter {
        void operator()(X509* cert) const { X509_free(cert); }
    };

    std::vector<std::unique_ptr<X509, X509Deleter>> certs_;
};
