#pragma once

#include <cstddef>
#include <memory>
#include <utility>

class Channel;

// Read result codes shared by every stream
constexpr int STREAM_AGAIN = -1;   // nothing buffered right now
constexpr int STREAM_ERROR = -2;

// A bidirectional byte stream the shell forwarder pumps.
class DuplexStream {
public:
    virtual ~DuplexStream() = default;

    // Non-blocking: >0 bytes read, 0 at end of stream, STREAM_AGAIN or STREAM_ERROR.
    virtual int read_some(char* buf, size_t len) = 0;

    // Blocks until all bytes are accepted. False on error.
    virtual bool write_all(const char* data, size_t len) = 0;

    // Descriptor that becomes readable when read_some may make progress.
    virtual int wait_fd() const = 0;

    // Propagate a local terminal resize. Default: ignored.
    virtual void resize(int /*cols*/, int /*rows*/) {}
};

// Stream over an interactive shell channel.
class ChannelStream : public DuplexStream {
public:
    explicit ChannelStream(std::unique_ptr<Channel> channel);
    ~ChannelStream() override;

    int read_some(char* buf, size_t len) override;
    bool write_all(const char* data, size_t len) override;
    int wait_fd() const override;
    void resize(int cols, int rows) override;

    Channel& channel() { return *channel_; }

private:
    std::unique_ptr<Channel> channel_;
};

// ── Split / reassemble ─────────────────────────────────────────
// A stream is split into a read half and a write half for one forwarding
// loop, then recombined. Halves from different splits cannot be joined.

struct SplitState;
class ReadHalf;
class WriteHalf;

std::pair<ReadHalf, WriteHalf> split_stream(std::unique_ptr<DuplexStream> stream);

// Throws std::logic_error when the halves did not come from the same split.
std::unique_ptr<DuplexStream> unsplit_stream(ReadHalf reader, WriteHalf writer);

class ReadHalf {
public:
    ReadHalf() = default;
    ReadHalf(ReadHalf&&) = default;
    ReadHalf& operator=(ReadHalf&&) = default;

    int read_some(char* buf, size_t len);
    int wait_fd() const;
    bool valid() const { return state_ != nullptr; }

private:
    friend std::pair<ReadHalf, WriteHalf> split_stream(std::unique_ptr<DuplexStream>);
    friend std::unique_ptr<DuplexStream> unsplit_stream(ReadHalf, WriteHalf);
    std::shared_ptr<SplitState> state_;
};

class WriteHalf {
public:
    WriteHalf() = default;
    WriteHalf(WriteHalf&&) = default;
    WriteHalf& operator=(WriteHalf&&) = default;

    bool write_all(const char* data, size_t len);
    void resize(int cols, int rows);
    bool valid() const { return state_ != nullptr; }

private:
    friend std::pair<ReadHalf, WriteHalf> split_stream(std::unique_ptr<DuplexStream>);
    friend std::unique_ptr<DuplexStream> unsplit_stream(ReadHalf, WriteHalf);
    std::shared_ptr<SplitState> state_;
};
