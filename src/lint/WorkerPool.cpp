#include "lint/WorkerPool.hpp"

#include <iostream>
#include <system_error>
#include <vector>

namespace lint {

void run_workers(size_t n, const std::function<void()>& work, const ThreadFactory& spawn) {
    std::vector<std::thread> pool;
    pool.reserve(n);

    bool short_handed = false;
    for (size_t i = 0; i < n; ++i) {
        try {
            pool.push_back(spawn ? spawn(work) : std::thread(work));
        } catch (const std::system_error& e) {
            std::cerr << "warning: started " << pool.size() << " of " << n << " workers: " << e.what() << "\n";
            short_handed = true;
            break;
        }
    }

    if (short_handed || pool.empty()) work();

    for (auto& t : pool) t.join();
}

}  // namespace lint
