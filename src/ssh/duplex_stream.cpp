#include "duplex_stream.hpp"
#include "channel.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <stdexcept>

// ── ChannelStream ──────────────────────────────────────────────

ChannelStream::ChannelStream(std::unique_ptr<Channel> channel)
    : channel_(std::move(channel)) {}

ChannelStream::~ChannelStream() = default;

int ChannelStream::read_some(char* buf, size_t len) {
    int n = channel_->try_read(buf, len);
    if (n >= 0) return n;
    if (n == CHANNEL_AGAIN) return channel_->eof() ? 0 : STREAM_AGAIN;
    bssh_log("shell channel read error rc=" + std::to_string(n));
    return STREAM_ERROR;
}

bool ChannelStream::write_all(const char* data, size_t len) {
    auto r = channel_->write_all(data, len);
    if (r.is_err()) {
        bssh_log_error("shell channel write", r);
        return false;
    }
    return true;
}

int ChannelStream::wait_fd() const {
    return channel_->session()->socket();
}

void ChannelStream::resize(int cols, int rows) {
    auto r = channel_->resize_pty(cols, rows);
    if (r.is_err()) bssh_log_error("pty resize", r);
}

// ── Split / reassemble ─────────────────────────────────────────

struct SplitState {
    std::unique_ptr<DuplexStream> stream;
};

int ReadHalf::read_some(char* buf, size_t len) {
    if (!state_ || !state_->stream) return STREAM_ERROR;
    return state_->stream->read_some(buf, len);
}

int ReadHalf::wait_fd() const {
    if (!state_ || !state_->stream) return -1;
    return state_->stream->wait_fd();
}

bool WriteHalf::write_all(const char* data, size_t len) {
    if (!state_ || !state_->stream) return false;
    return state_->stream->write_all(data, len);
}

void WriteHalf::resize(int cols, int rows) {
    if (state_ && state_->stream) state_->stream->resize(cols, rows);
}

std::pair<ReadHalf, WriteHalf> split_stream(std::unique_ptr<DuplexStream> stream) {
    if (!stream) throw std::logic_error("split_stream: null stream");

    auto state = std::make_shared<SplitState>();
    state->stream = std::move(stream);

    ReadHalf reader;
    WriteHalf writer;
    reader.state_ = state;
    writer.state_ = state;
    return {std::move(reader), std::move(writer)};
}

std::unique_ptr<DuplexStream> unsplit_stream(ReadHalf reader, WriteHalf writer) {
    if (!reader.state_ || reader.state_ != writer.state_) {
        throw std::logic_error("unsplit_stream: halves come from different streams");
    }
    auto stream = std::move(reader.state_->stream);
    reader.state_.reset();
    writer.state_.reset();
    return stream;
}
