#pragma once
#include <string>

namespace qh {

struct Credentials {
    std::string account_id;
    std::string access_token;

    // form expected by the provider's Authorization header and stream handshake
    std::string authorization() const { return account_id + ":" + access_token; }
};

// Opaque source of provider credentials (login and token exchange live elsewhere).
class ICredentialSupplier {
public:
    virtual ~ICredentialSupplier() = default;
    // Throws CredentialError when no usable credentials are available.
    virtual Credentials load() = 0;
};

// Reads fyers_client_id.txt and fyers_access_token.txt from a directory.
class FileCredentialSupplier : public ICredentialSupplier {
public:
    explicit FileCredentialSupplier(std::string auth_dir) : auth_dir_(std::move(auth_dir)) {}
    Credentials load() override;

private:
    std::string auth_dir_;
};

}
