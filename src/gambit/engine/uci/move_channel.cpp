#include "gambit/engine/uci/move_channel.hpp"

namespace gambit::engine::uci
{
  bool MoveSender::send(std::string move)
  {
    if (!m_state)
      return false;
    std::lock_guard lk(m_state->mtx);
    if (m_state->receiverClosed)
      return false;
    m_state->queue.push_back(std::move(move));
    return true;
  }

  MoveReceiver::~MoveReceiver()
  {
    close();
  }

  MoveReceiver &MoveReceiver::operator=(MoveReceiver &&other) noexcept
  {
    if (this != &other)
    {
      close();
      m_state = std::move(other.m_state);
    }
    return *this;
  }

  std::optional<std::string> MoveReceiver::tryReceive()
  {
    if (!m_state)
      return std::nullopt;
    std::lock_guard lk(m_state->mtx);
    if (m_state->queue.empty())
      return std::nullopt;
    std::string move = std::move(m_state->queue.front());
    m_state->queue.pop_front();
    return move;
  }

  void MoveReceiver::close()
  {
    if (!m_state)
      return;
    std::lock_guard lk(m_state->mtx);
    m_state->receiverClosed = true;
    m_state->queue.clear();
  }

  std::pair<MoveSender, MoveReceiver> makeMoveChannel()
  {
    auto state = std::make_shared<detail::ChannelState>();
    return {MoveSender(state), MoveReceiver(state)};
  }
} // namespace gambit::engine::uci
