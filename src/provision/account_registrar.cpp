#include "provision/account_registrar.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <thread>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace urls = boost::urls;
using tcp = boost::asio::ip::tcp;

namespace clusterboot {

HttpAccountRegistrar::HttpAccountRegistrar(const AcmeDnsConfig &config)
    : register_url_(config.register_url),
      attempts_(std::max(1, config.register_attempts)),
      timeout_(config.request_timeout) {}

std::string
HttpAccountRegistrar::request_body(const std::vector<std::string> &allow_from) {
  json::object body;
  if (!allow_from.empty()) {
    body["allowfrom"] = json::value_from(allow_from);
  }
  return json::serialize(body);
}

monad::MyResult<AcmeDnsAccount>
HttpAccountRegistrar::parse_response(int status, const std::string &body) {
  using Result = monad::MyResult<AcmeDnsAccount>;
  if (status != 201) {
    monad::Error err{.code = my_errors::NETWORK::BAD_STATUS,
                     .what = fmt::format("acme-dns register returned HTTP {}: {}",
                                         status, body)};
    err.response_status = status;
    return Result::Err(std::move(err));
  }
  boost::system::error_code ec;
  json::value jv = json::parse(body, ec);
  if (ec || !jv.is_object()) {
    return Result::Err(
        monad::Error{.code = my_errors::JSON::MALFORMED,
                     .what = "acme-dns register response is not a JSON object"});
  }
  try {
    auto account = json::value_to<AcmeDnsAccount>(jv);
    if (account.username.empty() || account.password.empty() ||
        account.fulldomain.empty()) {
      return Result::Err(monad::Error{
          .code = my_errors::JSON::MISSING_JSON_FIELD,
          .what = "acme-dns register response has empty credentials"});
    }
    return Result::Ok(std::move(account));
  } catch (const std::exception &e) {
    return Result::Err(monad::Error{
        .code = my_errors::JSON::MISSING_JSON_FIELD,
        .what = std::string("acme-dns register response incomplete: ") +
                e.what()});
  }
}

monad::MyResult<AcmeDnsAccount> HttpAccountRegistrar::register_once(
    const std::vector<std::string> &allow_from,
    const CancellationSignal *cancel) {
  using Result = monad::MyResult<AcmeDnsAccount>;
  auto parsed = urls::parse_uri(register_url_);
  if (parsed.has_error() || parsed.value().scheme() != "http") {
    return Result::Err(monad::Error{
        .code = my_errors::NETWORK::INVALID_URL,
        .what = "register_url must be an http:// URL: " + register_url_});
  }
  urls::url_view url = parsed.value();
  std::string host = url.host();
  std::string port = url.has_port() ? std::string(url.port()) : "80";
  std::string target = url.encoded_target().empty()
                           ? std::string("/")
                           : std::string(url.encoded_target());

  http::request<http::string_body> req{http::verb::post, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  req.body() = request_body(allow_from);
  req.prepare_payload();

  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::error_code failure;
  bool done = false;
  bool stopping = false;

  auto finish = [&](beast::error_code ec) {
    failure = ec;
    done = true;
  };
  resolver.async_resolve(
      host, port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec || stopping) {
          return finish(ec);
        }
        stream.expires_after(timeout_);
        stream.async_connect(
            results, [&](beast::error_code ec, const tcp::endpoint &) {
              if (ec || stopping) {
                return finish(ec);
              }
              stream.expires_after(timeout_);
              http::async_write(
                  stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec || stopping) {
                      return finish(ec);
                    }
                    http::async_read(stream, buffer, res,
                                     [&](beast::error_code ec, std::size_t) {
                                       finish(ec);
                                     });
                  });
            });
      });

  // Run in slices so a cancel aborts whichever phase is in flight.
  while (!done) {
    if (cancel && cancel->cancelled()) {
      stopping = true;
      resolver.cancel();
      stream.cancel();
      ioc.restart();
      ioc.run();
      return Result::Err(monad::Error{
          .code = my_errors::PROVISION::CANCELLED,
          .what = "acme-dns register request to " + register_url_ +
                  " cancelled"});
    }
    ioc.run_for(kRequestCancelSlice);
    if (ioc.stopped() && !done) {
      ioc.restart();
    }
  }

  if (failure) {
    int code = failure == beast::error::timeout
                   ? my_errors::NETWORK::TIMEOUT_ERROR
                   : my_errors::NETWORK::CONNECT_ERROR;
    return Result::Err(monad::Error{
        .code = code,
        .what = "acme-dns register request to " + register_url_ +
                " failed: " + failure.message()});
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Shutdown after register: " << ec.message();
  }
  return parse_response(res.result_int(), res.body());
}

monad::MyResult<AcmeDnsAccount>
HttpAccountRegistrar::register_account(const std::vector<std::string> &allow_from,
                                       const CancellationSignal *cancel) {
  using Result = monad::MyResult<AcmeDnsAccount>;
  monad::Error last{.code = my_errors::NETWORK::CONNECT_ERROR,
                    .what = "no registration attempt made"};
  for (int attempt = 0; attempt < attempts_; ++attempt) {
    if (attempt > 0) {
      auto delay = kRegisterRetryStep * attempt;
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Retrying acme-dns registration in " << delay.count() << "ms";
      if (cancel) {
        if (cancel->wait_for(delay)) {
          return Result::Err(
              monad::Error{.code = my_errors::PROVISION::CANCELLED,
                           .what = "acme-dns registration cancelled"});
        }
      } else {
        std::this_thread::sleep_for(delay);
      }
    }
    auto r = register_once(allow_from, cancel);
    if (r.is_ok()) {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Registered acme-dns account " << r.value().fulldomain;
      return r;
    }
    last = r.error();
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "acme-dns registration attempt " << (attempt + 1) << "/"
        << attempts_ << " failed: " << last.what;
    if (!is_retryable_registration_error(last)) {
      break;
    }
  }
  return Result::Err(std::move(last));
}

} // namespace clusterboot
