#include <rex/common/log.h>
#include <rex/decision/reasoner.hpp>

#include <regex>
#include <sstream>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace rex::decision {
ReasonerResult
UnavailableReasoner::resolve(const ReasonerRequest&) {
  ReasonerResult r;
  r.status = REX_UNAVAILABLE;
  r.error = "no reasoner endpoint configured";
  return r;
}

HttpReasoner::HttpReasoner(std::string endpoint,
                           std::chrono::milliseconds timeout)
  : m_endpoint(std::move(endpoint))
  , m_timeout(timeout) {}

bool
HttpReasoner::parseEndpoint(const std::string& endpoint,
                            std::string& host,
                            std::string& port,
                            std::string& target) {
  static const std::regex matchEndpoint(
    "^http://([^/:]+)(?::([0-9]+))?(/.*)?$");
  std::smatch m;
  if(!std::regex_match(endpoint, m, matchEndpoint))
    return false;
  host = m[1].str();
  port = m[2].matched ? m[2].str() : "80";
  target = m[3].matched ? m[3].str() : "/";
  return true;
}

std::string
HttpReasoner::encodeRequest(const ReasonerRequest& request) {
  boost::property_tree::ptree ptree;
  ptree.put("requestType", RequestTypeToStr(request.type));

  boost::property_tree::ptree context;
  for(auto& [key, value] : request.context)
    context.put(key, value);
  ptree.add_child("context", context);

  boost::property_tree::ptree allowed;
  for(auto& a : request.allowed) {
    boost::property_tree::ptree entry;
    entry.put("", a);
    allowed.push_back(std::make_pair("", entry));
  }
  ptree.add_child("allowed", allowed);

  std::ostringstream os;
  boost::property_tree::json_parser::write_json(os, ptree, false);
  return os.str();
}

ReasonerResult
HttpReasoner::decodeResponse(const std::string& body) {
  ReasonerResult r;
  try {
    boost::property_tree::ptree ptree;
    std::istringstream iss(body);
    boost::property_tree::json_parser::read_json(iss, ptree);

    r.decision = ptree.get<std::string>("decision");
    r.confidence = ptree.get<float>("confidence");
    r.status = REX_OK;
  } catch(const boost::property_tree::ptree_error& e) {
    r.status = REX_MALFORMED_RESPONSE;
    r.error = e.what();
  }
  return r;
}

ReasonerResult
HttpReasoner::resolve(const ReasonerRequest& request) {
  ReasonerResult result;

  std::string host, port, target;
  if(!parseEndpoint(m_endpoint, host, port, target)) {
    result.status = REX_INVALID_ARGUMENT;
    result.error = "invalid endpoint " + m_endpoint;
    return result;
  }

  try {
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    stream.expires_after(m_timeout);
    stream.connect(resolver.resolve(host, port));

    http::request<http::string_body> req{ http::verb::post, target, 11 };
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.body() = encodeRequest(request);
    req.prepare_payload();

    stream.expires_after(m_timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if(res.result() != http::status::ok) {
      result.status = REX_UNAVAILABLE;
      result.error =
        "reasoner answered with HTTP " + std::to_string(res.result_int());
      return result;
    }
    return decodeResponse(res.body());
  } catch(const beast::system_error& e) {
    result.status = e.code() == beast::error::timeout ? REX_TIMEOUT
                                                      : REX_UNAVAILABLE;
    result.error = e.what();
  }

  rex_log(REX_REASONER,
          REX_LOCALWARNING,
          "Reasoner call to {} failed: {}",
          m_endpoint,
          result.error);
  return result;
}
}
