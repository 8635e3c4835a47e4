#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace gambit::engine::uci
{
  namespace detail
  {
    struct ChannelState
    {
      std::mutex mtx;
      std::deque<std::string> queue;
      bool receiverClosed{false};
    };
  } // namespace detail

  // Producer end; owned by the listener thread.
  class MoveSender
  {
  public:
    MoveSender() = default;
    explicit MoveSender(std::shared_ptr<detail::ChannelState> state) : m_state(std::move(state)) {}

    // False once the receiver is gone; the message is dropped.
    bool send(std::string move);

  private:
    std::shared_ptr<detail::ChannelState> m_state;
  };

  // Consumer end; polled by the game loop.
  class MoveReceiver
  {
  public:
    MoveReceiver() = default;
    explicit MoveReceiver(std::shared_ptr<detail::ChannelState> state) : m_state(std::move(state)) {}
    ~MoveReceiver();

    MoveReceiver(const MoveReceiver &) = delete;
    MoveReceiver &operator=(const MoveReceiver &) = delete;
    MoveReceiver(MoveReceiver &&) noexcept = default;
    MoveReceiver &operator=(MoveReceiver &&other) noexcept;

    // Never blocks.
    std::optional<std::string> tryReceive();

    // Drops queued messages and makes every later send fail.
    void close();

  private:
    std::shared_ptr<detail::ChannelState> m_state;
  };

  // Unbounded single-producer/single-consumer queue of move notations.
  std::pair<MoveSender, MoveReceiver> makeMoveChannel();
} // namespace gambit::engine::uci
