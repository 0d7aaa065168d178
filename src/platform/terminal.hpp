#pragma once

namespace platform {

// RAII guard around handing the controlling terminal to a child job.
// Constructor records the terminal attributes and our process group and
// ignores SIGTTOU so the terminal can be taken back from the background.
// Destructor reclaims the terminal, restores the attributes and the
// previous SIGTTOU disposition. All of it is a no-op when stdin is not a
// terminal.
class ForegroundGuard {
public:
    ForegroundGuard();
    ~ForegroundGuard();

    ForegroundGuard(const ForegroundGuard&) = delete;
    ForegroundGuard& operator=(const ForegroundGuard&) = delete;

    // True if stdin is a terminal we can hand off.
    bool active() const { return impl_ != nullptr; }

    // Terminal file descriptor to pass to spawn(), or -1 when inactive.
    int tty() const;

    // Give the terminal back to our own process group now (also done by
    // the destructor).
    void reclaim();

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
