#include "tickhttp.hpp"

RequestPool::RequestPool(ATickSource* tick_source, ATransportFactory* factory)
    : tick_source_(tick_source),
      factory_(factory),
      subscribed_(false),
      dispatch_depth_(0) {}

RequestPool::~RequestPool() {
    if (subscribed_ && tick_source_ != NULL) {
        tick_source_->unsubscribe(this);
    }

    for (std::vector<Request*>::iterator it = active_requests_.begin();
         it != active_requests_.end(); ++it) {
        delete *it;
    }

    log(LOG_TRACE, "RequestPool resources cleaned up");
}

Request* RequestPool::send(const RequestSettings& settings) {
    Request* request = NULL;
    try {
        request = new Request(settings, factory_);
    } catch (const std::exception& e) {
        log(LOG_ERROR, "Failed to create request for %s: %s",
            settings.url_.c_str(), e.what());
        return NULL;
    }

    ++dispatch_depth_;
    bool pending = request->start();
    --dispatch_depth_;

    if (!pending) {
        // Callbacks have already fired
        delete request;
        if (dispatch_depth_ == 0) {
            sweep_completed();
        }
        return NULL;
    }

    active_requests_.push_back(request);
    log(LOG_DEBUG, "Request for %s added to pool (%zu active)",
        request->url().c_str(), active_requests_.size());

    if (dispatch_depth_ == 0) {
        update_subscription();
    }
    return request;
}

bool RequestPool::cancel(Request* request) {
    if (!contains(request)) {
        log(LOG_WARNING, "Cannot cancel request not managed by the pool");
        return false;
    }

    ++dispatch_depth_;
    request->abort();
    --dispatch_depth_;

    if (dispatch_depth_ == 0) {
        sweep_completed();
    }
    return true;
}

void RequestPool::cancel_all() {
    std::vector<Request*> snapshot(active_requests_);

    ++dispatch_depth_;
    for (std::vector<Request*>::iterator it = snapshot.begin();
         it != snapshot.end(); ++it) {
        (*it)->abort();
    }
    --dispatch_depth_;

    if (dispatch_depth_ == 0) {
        sweep_completed();
    }
}

void RequestPool::on_tick() {
    if (dispatch_depth_ > 0) {
        log(LOG_WARNING, "Ignoring tick delivered from a request callback");
        return;
    }

    // Requests added by callbacks during this tick wait for the next one
    std::vector<Request*> snapshot(active_requests_);

    ++dispatch_depth_;
    for (std::vector<Request*>::iterator it = snapshot.begin();
         it != snapshot.end(); ++it) {
        if (!(*it)->is_complete()) {
            (*it)->read_content();
        }
    }
    --dispatch_depth_;

    sweep_completed();
}

void RequestPool::sweep_completed() {
    std::vector<Request*>::iterator it = active_requests_.begin();
    while (it != active_requests_.end()) {
        if ((*it)->is_complete()) {
            log(LOG_DEBUG, "Evicting request for %s",
                (*it)->url().c_str());
            delete *it;
            it = active_requests_.erase(it);
        } else {
            ++it;
        }
    }

    update_subscription();
}

void RequestPool::update_subscription() {
    if (tick_source_ == NULL) {
        return;
    }

    if (!active_requests_.empty() && !subscribed_) {
        subscribed_ = true;
        tick_source_->subscribe(this);
        log(LOG_DEBUG, "RequestPool attached to tick source");
    } else if (active_requests_.empty() && subscribed_) {
        subscribed_ = false;
        tick_source_->unsubscribe(this);
        log(LOG_DEBUG, "RequestPool detached from tick source");
    }
}

size_t RequestPool::get_active_request_count() const {
    return active_requests_.size();
}

bool RequestPool::contains(const Request* request) const {
    return std::find(active_requests_.begin(), active_requests_.end(),
                     request) != active_requests_.end();
}
