#include "support/fake_ledger.hpp"
#include "core/slot_index.hpp"
#include "ledger/errors.hpp"

namespace fakes {

void FakeLedger::fill_active(uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint64_t index = 0; index < count; ++index) {
        Slot& slot = slots_[index];
        slot.status = ledger::MatchStatus::Active;
        slot.player1 = "stranger-a-" + std::to_string(index);
        slot.player2 = "stranger-b-" + std::to_string(index);
    }
}

void FakeLedger::set_slot(uint64_t index, const Slot& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[index] = slot;
}

FakeLedger::Slot FakeLedger::slot(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    return it == slots_.end() ? Slot{} : it->second;
}

void FakeLedger::set_raw_report(uint64_t index, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    raw_reports_[index] = text;
}

void FakeLedger::fail_next_calls(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_pending_ = count;
}

void FakeLedger::mark_registered(const ledger::PlayerId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.insert(id);
}

int FakeLedger::board_queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return board_queries_;
}

int FakeLedger::rejected_moves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_moves_;
}

void FakeLedger::maybe_fail() {
    if (failures_pending_ > 0) {
        failures_pending_--;
        throw ledger::TransportError("connection refused");
    }
}

ledger::PlayerId FakeLedger::Client::register_my_player() {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();
    if (!ledger_.registered_.insert(id_).second) {
        throw ledger::RpcError("player already registered");
    }
    return id_;
}

ledger::PlayerId FakeLedger::Client::get_my_player() {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();
    if (ledger_.registered_.count(id_) == 0) {
        throw ledger::RpcError("player not found");
    }
    return id_;
}

std::string FakeLedger::Client::get_checkers_board(uint32_t x, uint32_t y) {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();
    ledger_.board_queries_++;

    const uint64_t index = core::SlotIndex::encode(x, y);
    auto raw = ledger_.raw_reports_.find(index);
    if (raw != ledger_.raw_reports_.end()) {
        return raw->second;
    }

    Slot slot;
    auto it = ledger_.slots_.find(index);
    if (it != ledger_.slots_.end()) slot = it->second;

    ledger::BoardReport report;
    report.status = slot.status;
    report.player1 = slot.player1;
    report.player2 = slot.player2;
    report.board = slot.board;
    return ledger::format_board_report(report);
}

void FakeLedger::Client::new_checkers_game(uint32_t x, uint32_t y, const std::string& other_player) {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();

    Slot& slot = ledger_.slots_[core::SlotIndex::encode(x, y)];
    const bool replace = ledger_.creates_overwrite &&
                         slot.status == ledger::MatchStatus::WaitingForJoin;
    if (slot.status != ledger::MatchStatus::NotStarted && !replace) {
        throw ledger::RpcError("game already exists");
    }

    slot = Slot{};
    slot.player1 = id_;
    if (other_player == "0") {
        slot.status = ledger::MatchStatus::WaitingForJoin;
    } else {
        slot.player2 = other_player;
        slot.status = ledger::MatchStatus::Active;
    }
}

void FakeLedger::Client::join_checkers_game(uint32_t x, uint32_t y) {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();

    Slot& slot = ledger_.slots_[core::SlotIndex::encode(x, y)];
    if (slot.status != ledger::MatchStatus::WaitingForJoin) {
        throw ledger::RpcError("game is not waiting for a player");
    }
    if (slot.player1 == id_) {
        throw ledger::RpcError("cannot join your own game");
    }
    slot.player2 = id_;
    slot.status = ledger::MatchStatus::Active;
}

void FakeLedger::Client::play_checkers(uint32_t x, uint32_t y, const core::Move& move) {
    std::lock_guard<std::mutex> lock(ledger_.mutex_);
    ledger_.maybe_fail();

    Slot& slot = ledger_.slots_[core::SlotIndex::encode(x, y)];
    if (slot.status != ledger::MatchStatus::Active) {
        ledger_.rejected_moves_++;
        throw ledger::RpcError("game is not active");
    }
    const ledger::PlayerId& expected = slot.to_move == core::Side::Red ? slot.player1 : slot.player2;
    if (expected != id_) {
        ledger_.rejected_moves_++;
        throw ledger::RpcError("not your turn");
    }

    bool legal = false;
    for (const auto& candidate : ledger_.generator_.generate(slot.board, slot.to_move)) {
        if (candidate == move) {
            legal = true;
            break;
        }
    }
    if (!legal || !slot.board.apply(move)) {
        ledger_.rejected_moves_++;
        throw ledger::RpcError("illegal move " + move.to_string());
    }

    slot.to_move = core::opponent(slot.to_move);
    slot.moves++;
    if (ledger_.finish_after_moves > 0 && slot.moves >= ledger_.finish_after_moves) {
        slot.status = ledger::MatchStatus::Finished;
    }
}

} // namespace fakes
