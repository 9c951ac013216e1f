#pragma once
#include <array>
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/event_source.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

// Serves one text/event-stream response over a chunked HTTP body. The
// session is driven by the source's notifier: each notification drains
// whatever payloads are ready, and the response ends once the source is
// exhausted or the peer goes away.
class EventStreamSession : public std::enable_shared_from_this<EventStreamSession> {
public:
  EventStreamSession(beast::tcp_stream&& stream, std::shared_ptr<EventSource> source,
                     unsigned version);
  ~EventStreamSession();

  void run();

private:
  void onHeaderWritten(beast::error_code ec, std::size_t bytes_transferred);
  void pump();
  void onChunkWritten(beast::error_code ec, std::size_t bytes_transferred);
  void onLastChunkWritten(beast::error_code ec, std::size_t bytes_transferred);
  void doPeerRead();
  void onPeerRead(beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  beast::tcp_stream stream_;
  std::shared_ptr<EventSource> source_;
  http::response<http::empty_body> res_;
  http::response_serializer<http::empty_body> sr_;
  std::string chunk_;
  std::array<char, 512> peer_buffer_{};
  bool header_written_{false};
  bool writing_{false};
  bool finishing_{false};
  bool closed_{false};
};

}
