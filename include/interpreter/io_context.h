#pragma once

#include <unistd.h>

#include <utility>
#include <vector>

// Descriptors a statement reads from and writes to. Threaded through every execution call
// in place of process-wide stdio; command substitution swaps only its own copy.
struct IoContext {
    int in = STDIN_FILENO;
    int out = STDOUT_FILENO;
    int err = STDERR_FILENO;
    // target fd -> source fd pairs a child applies after the three standard streams
    std::vector<std::pair<int, int>> extra;

    static IoContext standard() {
        return IoContext{};
    }

    int fd_for(int target) const {
        switch (target) {
            case STDIN_FILENO:
                return in;
            case STDOUT_FILENO:
                return out;
            case STDERR_FILENO:
                return err;
            default:
                for (const auto& entry : extra) {
                    if (entry.first == target) {
                        return entry.second;
                    }
                }
                return target;
        }
    }

    void assign(int target, int source) {
        switch (target) {
            case STDIN_FILENO:
                in = source;
                break;
            case STDOUT_FILENO:
                out = source;
                break;
            case STDERR_FILENO:
                err = source;
                break;
            default:
                for (auto& entry : extra) {
                    if (entry.first == target) {
                        entry.second = source;
                        return;
                    }
                }
                extra.emplace_back(target, source);
                break;
        }
    }
};
