#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "channel.hpp"

class Session;

// Run a command on a fresh PTY-backed exec channel and read it to end of
// stream. A non-zero exit status is ErrorKind::CommandFailed; the result
// value still carries the captured output and the exit code.
Result<SSHResult> exec_one_shot(const std::shared_ptr<Session>& session,
                                const std::string& command,
                                const PtyOptions& pty = PtyOptions::from_terminal());

// Drain an already-started exec channel into an SSHResult.
Result<SSHResult> collect_output(Channel& channel);
