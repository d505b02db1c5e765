#include "text_intake.h"
#include "utils.h"

namespace live_relay {

ConsoleTextIntake::ConsoleTextIntake(int input_fd, std::ostream& prompt_out)
    : reader_(input_fd), prompt_out_(prompt_out) {}

std::optional<ClientTurn> ConsoleTextIntake::next(const StopToken& stop) {
    prompt_out_ << "message > " << std::flush;

    std::string line;
    if (!reader_.read_line([&stop] { return stop.stop_requested(); }, line)) {
        return std::nullopt;
    }
    if (utils::normalize_copy(utils::trim_copy(line)) == "q") {
        return std::nullopt;
    }

    ClientTurn turn;
    turn.text = line;
    return turn;
}

ChannelTextIntake::ChannelTextIntake() {
    channel_ = std::make_shared<BoundedChannel<ClientTurn>>(BoundedChannel<ClientTurn>::UNBOUNDED);
    channel_->close();
}

void ChannelTextIntake::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_->close();
    channel_ = std::make_shared<BoundedChannel<ClientTurn>>(BoundedChannel<ClientTurn>::UNBOUNDED);
}

std::shared_ptr<BoundedChannel<ClientTurn>> ChannelTextIntake::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

std::optional<ClientTurn> ChannelTextIntake::next(const StopToken& stop) {
    if (stop.stop_requested()) {
        return std::nullopt;
    }
    return current()->get();
}

void ChannelTextIntake::cancel() {
    current()->close();
}

bool ChannelTextIntake::submit(ClientTurn turn) {
    return current()->put(std::move(turn));
}

} // namespace live_relay
