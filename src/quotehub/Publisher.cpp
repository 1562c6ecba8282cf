// Publisher.cpp

#include "quotehub/Publisher.hpp"
#include <exception>
#include <iostream>

namespace qh {

Publisher::HandlerId Publisher::subscribe(const std::string& name, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sub : subscribers_) {
        if (sub.name == name) return sub.id;
    }
    const HandlerId id = next_id_++;
    subscribers_.push_back(Subscriber{id, name, std::move(handler)});
    return id;
}

bool Publisher::unsubscribe(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->id == id) { subscribers_.erase(it); return true; }
    }
    return false;
}

std::size_t Publisher::notify(const Snapshot& snapshot) const {
    // deliver outside the lock so a subscriber may (un)subscribe from its callback
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = subscribers_;
    }

    #ifdef QH_DEBUG
        std::cout << "[debug] [Publisher] notify " << targets.size()
                  << " subscribers, " << snapshot.size() << " quotes\n";
    #endif

    std::size_t delivered = 0;
    for (const auto& sub : targets) {
        try {
            sub.handler(snapshot);
            ++delivered;
        } catch (const std::exception& e) {
            std::cerr << "[Publisher] Subscriber '" << sub.name << "' failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[Publisher] Subscriber '" << sub.name << "' failed with a non-standard exception\n";
        }
    }
    return delivered;
}

}
