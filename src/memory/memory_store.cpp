#include "devmem/memory/memory_store.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace devmem {

std::string to_string(MemoryTarget target) {
    switch (target) {
        case MemoryTarget::System1: return "system1";
        case MemoryTarget::System2: return "system2";
        case MemoryTarget::Both: return "both";
    }
    return "system1";
}

std::string to_string(UpdateOperation operation) {
    switch (operation) {
        case UpdateOperation::Add: return "add";
        case UpdateOperation::Update: return "update";
        case UpdateOperation::Remove: return "remove";
    }
    return "add";
}

json MemoryUpdate::to_json() const {
    json j;
    j["type"] = devmem::to_string(type);
    j["operation"] = devmem::to_string(operation);
    j["target"] = target;
    j["data"] = data;
    if (!metadata.is_null()) {
        j["metadata"] = metadata;
    }
    return j;
}

// ==========================================
// InMemoryMemoryStore
// ==========================================

void InMemoryMemoryStore::update_system1(const MemoryUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(system1_, update);
}

void InMemoryMemoryStore::update_system2(const MemoryUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(system2_, update);
}

json InMemoryMemoryStore::query(MemoryTarget system, const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (system) {
        case MemoryTarget::System1:
            return lookup(system1_, target);
        case MemoryTarget::System2:
            return lookup(system2_, target);
        case MemoryTarget::Both:
            return {
                {"system1", lookup(system1_, target)},
                {"system2", lookup(system2_, target)}
            };
    }
    return nullptr;
}

size_t InMemoryMemoryStore::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

void InMemoryMemoryStore::apply(Collections& collections, const MemoryUpdate& update) {
    if (update.target.empty()) {
        throw std::invalid_argument("Memory update has no target collection");
    }

    switch (update.operation) {
        case UpdateOperation::Add: {
            json& collection = collections[update.target];
            if (collection.is_null()) {
                collection = json::array();
            } else if (!collection.is_array()) {
                // A collection set by update is wrapped so it can grow
                collection = json::array({collection});
            }
            collection.push_back(update.data);
            break;
        }
        case UpdateOperation::Update:
            collections[update.target] = update.data;
            break;
        case UpdateOperation::Remove: {
            auto it = collections.find(update.target);
            if (it == collections.end()) break;

            if (update.data.is_null() || !it->second.is_array()) {
                collections.erase(it);
                break;
            }
            json& collection = it->second;
            json kept = json::array();
            for (const auto& element : collection) {
                if (element != update.data) {
                    kept.push_back(element);
                }
            }
            collection = std::move(kept);
            break;
        }
    }

    update_count_++;
}

json InMemoryMemoryStore::lookup(const Collections& collections, const std::string& target) {
    auto it = collections.find(target);
    if (it == collections.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace devmem
