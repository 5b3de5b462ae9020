#include "capital/risk/position_book.hpp"

#include <iostream>
#include <mutex>

namespace capital {

// -----------------------------------------------------------------------------
// open: one Position per filled proposal
// -----------------------------------------------------------------------------
domain::Position PositionBook::open(const domain::TradeProposal& proposal,
                                    double quantity, double fill_price) {
  domain::Position pos;
  pos.id = position_ids_.next_id();
  pos.account_id = proposal.account_id;
  pos.symbol = proposal.symbol;
  pos.sector = proposal.sector;
  pos.direction = proposal.direction;
  pos.quantity = quantity;
  pos.entry_price = fill_price;
  pos.stop_loss = proposal.stop_loss;
  pos.take_profit = proposal.take_profit;
  pos.cost_basis = quantity * fill_price;
  pos.status = domain::PositionStatus::Open;

  {
    std::unique_lock lock(mutex_);
    positions_.emplace(pos.id, pos);
  }

  std::cout << "[PositionBook] Opened #" << pos.id << " " << pos.account_id
            << " " << domain::directionToString(pos.direction) << " "
            << pos.quantity << " " << pos.symbol << " @ " << fill_price
            << "\n";
  return pos;
}

// -----------------------------------------------------------------------------
// close: signed realized P&L
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionBook::close(
    domain::PositionId position_id, double exit_price) {
  domain::Position closed;
  {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end() ||
        it->second.status != domain::PositionStatus::Open) {
      std::cerr << "[PositionBook] WARNING: close for unknown or closed "
                << "position #" << position_id << "\n";
      return std::nullopt;
    }

    auto& pos = it->second;
    pos.status = domain::PositionStatus::Closed;
    pos.exit_price = exit_price;
    pos.realized_pnl = realizedPnl(pos, exit_price);
    closed = pos;
  }

  std::cout << "[PositionBook] Closed #" << closed.id << " " << closed.symbol
            << " @ " << exit_price << " realized=" << closed.realized_pnl
            << "\n";
  return closed;
}

double PositionBook::realizedPnl(const domain::Position& pos,
                                 double exit_price) {
  const double sign = pos.direction == domain::Direction::Long ? 1.0 : -1.0;
  return (exit_price - pos.entry_price) * pos.quantity * sign;
}

domain::Position PositionBook::hydratePosition(domain::Position pos) {
  if (pos.id == 0) {
    pos.id = position_ids_.next_id();
  }
  if (pos.cost_basis == 0.0) {
    pos.cost_basis = pos.quantity * pos.entry_price;
  }
  pos.status = domain::PositionStatus::Open;

  std::unique_lock lock(mutex_);
  positions_[pos.id] = pos;
  return pos;
}

std::optional<domain::Position> PositionBook::position(
    domain::PositionId position_id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PositionBook::openPositions(
    const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [id, pos] : positions_) {
    if (pos.account_id == account_id &&
        pos.status == domain::PositionStatus::Open) {
      result.push_back(pos);
    }
  }
  return result;
}

double PositionBook::sectorNotional(const std::string& account_id,
                                    const std::string& sector) const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, pos] : positions_) {
    if (pos.account_id == account_id && pos.sector == sector &&
        pos.status == domain::PositionStatus::Open) {
      total += pos.cost_basis;
    }
  }
  return total;
}

std::size_t PositionBook::openCount(const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  std::size_t count = 0;
  for (const auto& [id, pos] : positions_) {
    if (pos.account_id == account_id &&
        pos.status == domain::PositionStatus::Open) {
      ++count;
    }
  }
  return count;
}

std::vector<domain::Position> PositionBook::getSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [id, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

}  // namespace capital
