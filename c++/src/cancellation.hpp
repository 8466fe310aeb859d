#pragma once

#include <functional>
#include <utility>

/**
 * Request-scoped cancellation signal.
 *
 * Once cancelled it stays cancelled. At most one handler is registered at a
 * time, through a Slot, by whichever operation is currently suspended (a
 * backend fetch, a pool wait or a client write); the handler aborts that
 * operation. Not thread-safe: the signal and everything that registers with
 * it live on the connection's io_context thread.
 */
class Cancellation {
  public:
    class Slot {
      public:
        Slot(Cancellation &cancellation, std::function<void()> handler)
            : m_cancellation(cancellation)
        {
            m_cancellation.m_handler = std::move(handler);
        }
        ~Slot() { m_cancellation.m_handler = nullptr; }

        Slot(const Slot &) = delete;
        Slot &operator=(const Slot &) = delete;

      private:
        Cancellation &m_cancellation;
    };

    void cancel()
    {
        if (m_cancelled)
        {
            return;
        }
        m_cancelled = true;
        if (m_handler)
        {
            auto handler = std::move(m_handler);
            m_handler = nullptr;
            handler();
        }
    }

    bool cancelled() const { return m_cancelled; }

  private:
    bool m_cancelled{false};
    std::function<void()> m_handler;
};
