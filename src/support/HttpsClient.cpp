#include "support/HttpsClient.hpp"
#include "quotehub/Errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace support {

HttpsClient::HttpsClient(std::string host, std::string port, std::chrono::seconds timeout)
    : host_(std::move(host)), port_(std::move(port)), timeout_(timeout) {}

HttpResponse HttpsClient::get(const std::string& target, const Headers& headers) const {
    try {
        net::io_context ioc;
        ssl::context ctx{ssl::context::tlsv12_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        tcp::resolver resolver{ioc};
        beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

        // SNI
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }

        auto const results = resolver.resolve(host_, port_);
        beast::get_lowest_layer(stream).expires_after(timeout_);
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json");
        for (const auto& [name, value] : headers) {
            req.set(name, value);
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.body = std::move(res.body());

        beast::error_code ec;
        stream.shutdown(ec);
        // servers routinely drop the connection without a close_notify
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            #ifdef QH_DEBUG
                std::cerr << "[debug] [HttpsClient] TLS shutdown: " << ec.message() << "\n";
            #endif
        }
        return out;
    } catch (const beast::system_error& e) {
        throw qh::TransportError("GET https://" + host_ + target + " failed: " + e.code().message());
    } catch (const std::exception& e) {
        throw qh::TransportError("GET https://" + host_ + target + " failed: " + e.what());
    }
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

}
