#ifndef ATICKSOURCE_HPP
#define ATICKSOURCE_HPP

#include "tickhttp.hpp"

// Receiver of the host's periodic notification.
class ATickListener {
   public:
    virtual ~ATickListener() {}

    virtual void on_tick() = 0;

};  // class ATickListener

// Host side of the periodic notification (an idle loop, a UI timer, ...).
// A listener is called once per tick for as long as it is subscribed.
class ATickSource {
   public:
    virtual ~ATickSource() {}

    virtual void subscribe(ATickListener* listener) = 0;

    // Safe to call from inside the listener's own on_tick()
    virtual void unsubscribe(ATickListener* listener) = 0;

};  // class ATickSource

#endif  // ATICKSOURCE_HPP
