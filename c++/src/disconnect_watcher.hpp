#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>

#include "cancellation.hpp"

/**
 * Keeps a read pending on the client socket while a response is produced, and
 * fires the request's Cancellation when the client closes or resets the
 * connection. Bytes of a pipelined request are appended to the session buffer
 * so the next read sees them.
 *
 * stop() must be called before the watcher, the buffer or the socket go away.
 */
class DisconnectWatcher {
  public:
    DisconnectWatcher(boost::beast::tcp_stream &client,
                      boost::beast::flat_buffer &buffer,
                      Cancellation &cancellation);

    void start(boost::asio::yield_context yield);
    void stop(boost::asio::yield_context yield);

  private:
    void watch(boost::asio::yield_context yield);

    boost::beast::tcp_stream &m_client;
    boost::beast::flat_buffer &m_buffer;
    Cancellation &m_cancellation;
    boost::asio::steady_timer m_exited;
    bool m_running{false};
    bool m_stopping{false};
};
