#include "event_stream_session.hpp"
#include "rest_api_handler_base.hpp"
#include <iostream>

namespace common {

EventStreamSession::EventStreamSession(beast::tcp_stream&& stream,
                                       std::shared_ptr<EventSource> source,
                                       unsigned version)
  : stream_(std::move(stream)), source_(std::move(source)),
    res_{http::status::ok, version}, sr_{res_} {
  res_.set(http::field::content_type, "text/event-stream");
  res_.set(http::field::cache_control, "no-cache");
  res_.set(http::field::connection, "keep-alive");
  addCorsHeaders(res_);
  res_.chunked(true);
}

EventStreamSession::~EventStreamSession() {
  source_->close();
}

void EventStreamSession::run() {
  // Streams live as long as the task does; idle gaps are covered by keepalives.
  stream_.expires_never();

  std::weak_ptr<EventStreamSession> weak = shared_from_this();
  auto executor = stream_.get_executor();
  source_->setNotifier([weak, executor]() {
    if (auto self = weak.lock()) {
      net::post(executor, beast::bind_front_handler(&EventStreamSession::pump, self));
    }
  });

  writing_ = true;
  http::async_write_header(stream_, sr_,
    beast::bind_front_handler(&EventStreamSession::onHeaderWritten, shared_from_this()));
}

void EventStreamSession::onHeaderWritten(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);
  writing_ = false;

  if (ec) {
    std::cerr << "[HttpServer] Event stream header error: " << ec.message() << std::endl;
    return doClose();
  }

  header_written_ = true;
  doPeerRead();
  pump();
}

void EventStreamSession::pump() {
  if (closed_ || writing_ || finishing_ || !header_written_) {
    return;
  }

  if (auto payload = source_->poll()) {
    chunk_ = "data: " + *payload + "\n\n";
    writing_ = true;
    net::async_write(stream_, http::make_chunk(net::buffer(chunk_)),
      beast::bind_front_handler(&EventStreamSession::onChunkWritten, shared_from_this()));
    return;
  }

  if (source_->exhausted()) {
    finishing_ = true;
    writing_ = true;
    net::async_write(stream_, http::make_chunk_last(),
      beast::bind_front_handler(&EventStreamSession::onLastChunkWritten, shared_from_this()));
  }
}

void EventStreamSession::onChunkWritten(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);
  writing_ = false;

  if (ec) {
    if (!closed_) {
      std::cerr << "[HttpServer] Event stream write error: " << ec.message() << std::endl;
    }
    return doClose();
  }

  pump();
}

void EventStreamSession::onLastChunkWritten(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);
  writing_ = false;
  boost::ignore_unused(ec);
  doClose();
}

void EventStreamSession::doPeerRead() {
  stream_.async_read_some(net::buffer(peer_buffer_),
    beast::bind_front_handler(&EventStreamSession::onPeerRead, shared_from_this()));
}

void EventStreamSession::onPeerRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);
  if (closed_) {
    return;
  }

  // Anything after the request is ignored; an error means the client left.
  if (ec) {
    return doClose();
  }
  doPeerRead();
}

void EventStreamSession::doClose() {
  if (closed_) {
    return;
  }
  closed_ = true;
  source_->close();

  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
}

}
