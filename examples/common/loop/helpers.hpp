#pragma once

#include <thread>


namespace repsync::examples::loop {

// Yields after max_idle_spins consecutive polls without work.
// int idle_spins = 0;
// while (running) {
//     bool did_work = handler.poll() > 0;
//     manage_idle_spins(did_work, idle_spins);
// }
inline void manage_idle_spins(bool& did_work, int& idle_spins, int max_idle_spins = 100) {
    if (did_work) {
        idle_spins = 0;
        did_work = false;
    } else {
        if (++idle_spins > max_idle_spins) {
            std::this_thread::yield();
            idle_spins = 0;
        }
    }
}

} // namespace repsync::examples::loop
