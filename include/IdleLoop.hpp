#ifndef IDLELOOP_HPP
#define IDLELOOP_HPP

#include "tickhttp.hpp"

// Standalone host tick source. Calls every subscribed listener once per
// tick, sleeping tick_interval_ms between ticks.
class IdleLoop : public ATickSource {
   public:
    explicit IdleLoop(int tick_interval_ms);
    ~IdleLoop();

    void subscribe(ATickListener* listener);
    void unsubscribe(ATickListener* listener);

    // Ticks until no listener is subscribed or shutdown() is called.
    // Returns the number of ticks delivered.
    size_t run();

    // Delivers a single tick without sleeping.
    void tick();

    // Set the running flag to false and exit the loop
    void shutdown();

    size_t get_listener_count() const { return listeners_.size(); }
    int get_tick_interval() const { return tick_interval_ms_; }

    // Routes SIGINT / SIGTERM to shutdown() of this loop and ignores
    // SIGPIPE.
    bool setup_signal_handlers();

    // Getter for instance
    static IdleLoop* get_instance() { return instance_; }

   private:
    std::vector<ATickListener*> listeners_;
    int tick_interval_ms_;
    volatile bool ready_;  // Flag for the loop to keep ticking

    // Instance receiving the shutdown signals
    static IdleLoop* instance_;

    static void signal_handler(int signal);

    // Prevent copying
    IdleLoop(const IdleLoop&);
    IdleLoop& operator=(const IdleLoop&);

};  // class IdleLoop

#endif  // IDLELOOP_HPP
