#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <signal.h>

namespace platform {

struct ForegroundGuard::Impl {
    int fd;
    pid_t pgrp;
    struct termios saved_term;
    struct sigaction saved_ttou;
    bool reclaimed = false;
};

ForegroundGuard::ForegroundGuard() {
    if (!isatty(STDIN_FILENO)) return;

    impl_ = new Impl;
    impl_->fd = STDIN_FILENO;
    impl_->pgrp = getpgrp();
    tcgetattr(impl_->fd, &impl_->saved_term);

    struct sigaction sa;
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTTOU, &sa, &impl_->saved_ttou);
}

ForegroundGuard::~ForegroundGuard() {
    if (!impl_) return;
    reclaim();
    sigaction(SIGTTOU, &impl_->saved_ttou, nullptr);
    delete impl_;
}

int ForegroundGuard::tty() const {
    return impl_ ? impl_->fd : -1;
}

void ForegroundGuard::reclaim() {
    if (!impl_ || impl_->reclaimed) return;
    tcsetpgrp(impl_->fd, impl_->pgrp);
    // The shell may have left raw mode or echo off behind
    tcsetattr(impl_->fd, TCSADRAIN, &impl_->saved_term);
    impl_->reclaimed = true;
}

} // namespace platform
