#include "receptionist/utils/async.hpp"

#include <exception>
#include <string>
#include <thread>

#include "receptionist/logging.hpp"

namespace receptionist::utils {

void run_async(std::function<void()> task, const char* name) {
    std::thread worker([task = std::move(task), label = std::string(name ? name : "async")]() {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("task", label),
                 kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
