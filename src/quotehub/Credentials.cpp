#include "quotehub/Credentials.hpp"
#include "quotehub/Errors.hpp"
#include <fstream>
#include <sstream>

namespace qh {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string read_trimmed(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CredentialError("cannot read " + path);
    }
    std::stringstream buf;
    buf << in.rdbuf();
    std::string value = trim(buf.str());
    if (value.empty()) {
        throw CredentialError(path + " is empty");
    }
    return value;
}

} // namespace

Credentials FileCredentialSupplier::load() {
    std::string dir = auth_dir_.empty() ? "." : auth_dir_;
    Credentials creds;
    creds.account_id = read_trimmed(dir + "/fyers_client_id.txt");
    creds.access_token = read_trimmed(dir + "/fyers_access_token.txt");
    return creds;
}

}
