/*
  signal_handler.h

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <signal.h>

#include <vector>

// Blocks the given signals on the calling thread for the lifetime of the object. Threads
// started while a mask is held inherit it.
class SignalMask {
   private:
    sigset_t old_mask{};
    bool active;

   public:
    explicit SignalMask(int signum);

    explicit SignalMask(const std::vector<int>& signals);

    ~SignalMask();

    SignalMask(const SignalMask&) = delete;
    SignalMask& operator=(const SignalMask&) = delete;
};

// Restores default dispositions and an empty mask; called in forked children before exec.
void reset_child_signals();

// Records SIGINT and SIGTERM so foreground waits can forward them, and ignores SIGPIPE so
// in-process writers see EPIPE. SIGINT, SIGTERM and SIGCHLD also make wake_fd() readable.
// The previous dispositions are restored on destruction.
class SignalHandler {
   public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    static bool has_pending_signal();
    // Returns the pending signal number and clears it, or 0.
    static int take_pending_signal();

    static const char* get_signal_name(int signum);

    // Read end of the self-pipe, or -1 when it could not be created. Drain it before
    // checking state, then poll it, and no signal or child exit is missed.
    static int wake_fd();
    static void drain_wakeups();

    // Signals blocked in helper threads so delivery lands on the control thread.
    static const std::vector<int>& worker_blocked_signals();

   private:
    struct sigaction old_sigint_{};
    struct sigaction old_sigterm_{};
    struct sigaction old_sigchld_{};
    struct sigaction old_sigpipe_{};

    static void signal_handler(int signum);
    static void child_handler(int signum);
};
