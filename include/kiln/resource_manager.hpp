#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace kiln {

/**
 * @brief Owns resources shared by the build phases that follow preparation.
 *
 * Resources stay alive until `dispose_all` runs or the manager is destroyed;
 * dispose callbacks run in reverse registration order.
 */
class ResourceManager {
public:
    ResourceManager() = default;
    ResourceManager(const ResourceManager &) = delete;
    ResourceManager &operator=(const ResourceManager &) = delete;
    ResourceManager(ResourceManager &&) = default;
    ResourceManager &operator=(ResourceManager &&) = default;

    ~ResourceManager() {
        dispose_all();
    }

    void add_resource(std::shared_ptr<void> res, std::function<void()> on_dispose = {}) {
        resources_.push_back({std::move(res), std::move(on_dispose)});
    }

    size_t size() const {
        return resources_.size();
    }

    void dispose_all() {
        while (!resources_.empty()) {
            Entry entry = std::move(resources_.back());
            resources_.pop_back();
            if (entry.on_dispose) {
                entry.on_dispose();
            }
        }
    }

private:
    struct Entry {
        std::shared_ptr<void> resource;
        std::function<void()> on_dispose;
    };

    std::vector<Entry> resources_;
};

} // namespace kiln
