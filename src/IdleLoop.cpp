#include "tickhttp.hpp"

IdleLoop* IdleLoop::instance_ = NULL;

IdleLoop::IdleLoop(int tick_interval_ms)
    : tick_interval_ms_(tick_interval_ms), ready_(false) {
    if (tick_interval_ms_ <= 0) {
        tick_interval_ms_ = http_limits::TICK_INTERVAL_MS;
    }
}

IdleLoop::~IdleLoop() {
    if (instance_ == this) {
        instance_ = NULL;
    }
}

void IdleLoop::subscribe(ATickListener* listener) {
    if (std::find(listeners_.begin(), listeners_.end(), listener) !=
        listeners_.end()) {
        log(LOG_WARNING, "Listener already subscribed to idle loop");
        return;
    }
    listeners_.push_back(listener);
    log(LOG_TRACE, "Idle loop listener added (%zu subscribed)",
        listeners_.size());
}

void IdleLoop::unsubscribe(ATickListener* listener) {
    std::vector<ATickListener*>::iterator it =
        std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) {
        log(LOG_WARNING, "Listener not subscribed to idle loop");
        return;
    }
    listeners_.erase(it);
    log(LOG_TRACE, "Idle loop listener removed (%zu subscribed)",
        listeners_.size());
}

void IdleLoop::tick() {
    // Listeners may unsubscribe themselves while being notified
    std::vector<ATickListener*> snapshot(listeners_);

    for (std::vector<ATickListener*>::iterator it = snapshot.begin();
         it != snapshot.end(); ++it) {
        if (std::find(listeners_.begin(), listeners_.end(), *it) !=
            listeners_.end()) {
            (*it)->on_tick();
        }
    }
}

size_t IdleLoop::run() {
    size_t ticks = 0;
    ready_ = true;

    log(LOG_DEBUG, "Idle loop running every %d ms", tick_interval_ms_);

    while (ready_ && !listeners_.empty()) {
        // Sleep until the next tick
        if (poll(NULL, 0, tick_interval_ms_) < 0 && errno != EINTR) {
            log(LOG_ERROR, "Idle loop: poll error: %s", strerror(errno));
            break;
        }
        if (!ready_) {
            break;
        }

        tick();
        ++ticks;
    }

    ready_ = false;
    log(LOG_DEBUG, "Idle loop stopped after %zu ticks", ticks);
    return ticks;
}

void IdleLoop::shutdown() {
    ready_ = false;
    log(LOG_INFO, "Idle loop shutdown initiated");
}

bool IdleLoop::setup_signal_handlers() {
    instance_ = this;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &sa, NULL) < 0) {
        log(LOG_ERROR, "Failed to set up SIGINT handler");
        return false;
    }

    if (sigaction(SIGTERM, &sa, NULL) < 0) {
        log(LOG_ERROR, "Failed to set up SIGTERM handler");
        return false;
    }

    if (sigaction(SIGPIPE, &sa, NULL) < 0) {
        log(LOG_ERROR, "Failed to set up SIGPIPE handler");
        return false;
    }

    return true;
}

void IdleLoop::signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (instance_ != NULL) {
            instance_->shutdown();
        }
        log(LOG_INFO, "Received shutdown signal. Exiting...");
    } else if (signal == SIGPIPE) {
        // Ignore SIGPIPE to prevent crashes on broken pipes
        log(LOG_DEBUG, "Received SIGPIPE, ignoring");
    }
}
