#include "interrupt.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <signal.h>
#include <unistd.h>
#include <csignal>

static volatile std::sig_atomic_t g_interrupts = 0;
static struct sigaction g_previous;

extern "C" void par_on_sigint(int) {
    g_interrupts = g_interrupts + 1;
    if (g_interrupts > 1) _exit(130);
}

InterruptWatcher::InterruptWatcher(CancelToken token, Callback on_interrupt)
    : token_(std::move(token)), on_interrupt_(std::move(on_interrupt)) {
    g_interrupts = 0;

    struct sigaction sa = {};
    sa.sa_handler = par_on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, &g_previous);

    thread_ = std::thread(&InterruptWatcher::watch_loop, this);
}

InterruptWatcher::~InterruptWatcher() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    sigaction(SIGINT, &g_previous, nullptr);
}

void InterruptWatcher::watch_loop() {
    bool fired = false;
    while (!stop_.load()) {
        if (!fired && g_interrupts > 0) {
            fired = true;
            par_log("INTERRUPT: SIGINT received, cancelling run");
            token_.cancel();
            if (on_interrupt_) on_interrupt_();
        }
        platform::sleep_ms(100);
    }
}
