#include "chunkscribe/http_client.hpp"

#include "chunkscribe/logging.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace chunkscribe {

namespace {

// Starts one asynchronous operation and runs the context until it finishes.
// tcp_stream deadlines only apply to asynchronous operations.
template<typename Initiate>
void run_step(asio::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw beast::system_error(result);
    }
}

template<typename Stream>
void exchange(asio::io_context& ioc, Stream& stream, http::request<http::string_body>& req,
              http::response<http::string_body>& res) {
    run_step(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
    beast::flat_buffer buffer;
    run_step(ioc, [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });
}

} // namespace

HttpClient::HttpClient(std::string host, uint16_t port, bool use_ssl)
    : host_(std::move(host)), port_(port), use_ssl_(use_ssl), timeout_(30) {}

void HttpClient::set_timeout(int seconds) {
    timeout_ = seconds;
}

bool HttpClient::send_request(const std::string& method,
                              const std::string& target,
                              const std::string& body,
                              const std::string& content_type,
                              HttpResponse& response) {
    try {
        LOG_DEBUG("Sending HTTP ", method, " request to ", host_, ":", port_, target);

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        tcp::resolver::results_type endpoints;
        {
            beast::error_code resolve_ec;
            resolver.async_resolve(host_, std::to_string(port_),
                                   [&](beast::error_code ec, tcp::resolver::results_type results) {
                                       resolve_ec = ec;
                                       endpoints = std::move(results);
                                   });
            ioc.run();
            if (resolve_ec) {
                throw beast::system_error(resolve_ec);
            }
        }

        http::request<http::string_body> req{http::string_to_verb(method), target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, "chunkscribe");
        if (!content_type.empty()) {
            req.set(http::field::content_type, content_type);
        }
        req.body() = body;
        req.prepare_payload();

        http::response<http::string_body> res;
        const auto deadline = std::chrono::seconds(timeout_);

        if (use_ssl_) {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
            }
            stream.set_verify_callback(ssl::host_name_verification(host_));

            beast::get_lowest_layer(stream).expires_after(deadline);
            run_step(ioc, [&](auto handler) {
                beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
            });
            run_step(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
            exchange(ioc, stream, req, res);

            beast::error_code ec;
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(deadline);
            run_step(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
            exchange(ioc, stream, req, res);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        response.status = res.result_int();
        response.body = res.body();
        LOG_DEBUG("HTTP request completed with status ", response.status);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("HTTP request to ", host_, " failed: ", e.what());
        return false;
    }
}

std::string HttpClient::url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else if (c == ' ') {
            out << '+';
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string HttpClient::form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string encoded;
    for (const auto& [name, value] : fields) {
        if (!encoded.empty()) encoded += '&';
        encoded += url_encode(name);
        encoded += '=';
        encoded += url_encode(value);
    }
    return encoded;
}

} // namespace chunkscribe
