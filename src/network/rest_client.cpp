// ============================================================================
// VIGIL - REST Client Implementation
// ============================================================================
// Boost.Beast over OpenSSL
// ============================================================================

#include "vigil/network/rest_client.hpp"

#include "vigil/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace vigil::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

struct Endpoint {
    std::string host;
    std::string port = "443";
    std::string base_path;
};

Endpoint parse_base_url(std::string url) {
    Endpoint endpoint;
    if (url.rfind("https://", 0) == 0) {
        url = url.substr(8);
    }

    const auto slash = url.find('/');
    if (slash != std::string::npos) {
        endpoint.base_path = url.substr(slash);
        url = url.substr(0, slash);
        if (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    const auto colon = url.find(':');
    if (colon != std::string::npos) {
        endpoint.port = url.substr(colon + 1);
        url = url.substr(0, colon);
    }
    endpoint.host = url;
    return endpoint;
}

}  // namespace

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) ss << '&';
        ss << url_encode(key) << '=' << url_encode(value);
        first = false;
    }
    return ss.str();
}

// ============================================================================
// REST Client Implementation
// ============================================================================

struct RestClient::Impl {
    using https_stream = beast::ssl_stream<beast::tcp_stream>;

    explicit Impl(const RestClientConfig& config)
        : config_(config),
          endpoint_(parse_base_url(config.base_url)),
          ssl_context_(ssl::context::tlsv12_client) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    HttpResponse get(std::string_view path, const std::map<std::string, std::string>& params) {
        try {
            // Each request owns its io_context so concurrent callers never share a stream
            net::io_context io_context;
            tcp::resolver resolver(io_context);
            https_stream stream(io_context, ssl_context_);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
            }
            if (config_.verify_tls) {
                stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));
            }

            auto results = resolver.resolve(endpoint_.host, endpoint_.port);

            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_after(config_.request_timeout);
            lowest.connect(results);

            lowest.expires_after(config_.request_timeout);
            stream.handshake(ssl::stream_base::client);

            std::string target = endpoint_.base_path + std::string(path);
            if (!params.empty()) {
                target += "?" + build_query_string(params);
            }

            http::request<http::string_body> req{http::verb::get, target, 11};
            req.set(http::field::host, endpoint_.host);
            req.set(http::field::user_agent, config_.user_agent);
            req.set(http::field::accept, "application/json");

            lowest.expires_after(config_.request_timeout);
            http::write(stream, req);

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(stream, buffer, res);

            HttpResponse response;
            response.status_code = res.result_int();
            response.body = std::move(res.body());
            response.received_at = now();
            for (const auto& header : res) {
                response.headers[std::string(header.name_string())] = std::string(header.value());
            }

            // Graceful shutdown; servers commonly drop the connection first
            beast::error_code ec;
            lowest.expires_after(std::chrono::seconds(2));
            stream.shutdown(ec);

            return response;
        } catch (const std::exception& e) {
            LOG_DEBUG("GET {}{} failed: {}", endpoint_.host, path, e.what());
            HttpResponse error_response;
            error_response.status_code = -1;
            error_response.body = e.what();
            error_response.received_at = now();
            return error_response;
        }
    }

    RestClientConfig config_;
    Endpoint endpoint_;
    ssl::context ssl_context_;
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

RestClient::RestClient(const RestClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RestClient::~RestClient() = default;

HttpResponse RestClient::get(std::string_view path, const std::map<std::string, std::string>& params) {
    return impl_->get(path, params);
}

}  // namespace vigil::network
