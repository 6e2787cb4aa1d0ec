#ifndef REQUESTPOOL_HPP
#define REQUESTPOOL_HPP

#include "tickhttp.hpp"

// Forward declarations
class Request;
class ATickSource;
class ATransportFactory;
struct RequestSettings;

// Owns the in-flight Requests and advances each of them by one body read
// per tick. The pool is subscribed to its tick source exactly while it holds
// at least one Request.
class RequestPool : public ATickListener {
   public:
    // Neither tick_source nor factory is owned.
    RequestPool(ATickSource* tick_source, ATransportFactory* factory);
    ~RequestPool();  // Deletes all managed Request objects

    // Creates and starts a Request. Returns the Request, owned by the pool,
    // while its body is being read; NULL if it already finished during
    // setup (its callbacks have fired) or could not be created.
    Request* send(const RequestSettings& settings);

    // Aborts an in-flight Request (its error and complete callbacks fire)
    // and evicts it. When called from a callback, eviction happens once the
    // callback returns. Returns false if the Request is not in the pool.
    bool cancel(Request* request);

    // Aborts every in-flight Request.
    void cancel_all();

    // One read slice for every live Request, then evicts finished ones.
    void on_tick();

    size_t get_active_request_count() const;
    bool contains(const Request* request) const;
    bool is_subscribed() const { return subscribed_; }

   private:
    ATickSource* tick_source_;
    ATransportFactory* factory_;

    // The RequestPool owns the Request objects pointed to.
    std::vector<Request*> active_requests_;

    bool subscribed_;
    int dispatch_depth_;  // > 0 while Request callbacks may be running

    void sweep_completed();
    void update_subscription();

    // Prevent copying
    RequestPool(const RequestPool&);
    RequestPool& operator=(const RequestPool&);

};  // class RequestPool

#endif  // REQUESTPOOL_HPP
