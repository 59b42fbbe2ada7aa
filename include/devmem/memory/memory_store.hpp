#ifndef DEVMEM_MEMORY_MEMORY_STORE_HPP
#define DEVMEM_MEMORY_MEMORY_STORE_HPP

#include <string>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace devmem {

/**
 * @brief Which half of the dual memory an update is meant for
 *
 * System1 holds fast pattern knowledge, System2 deliberate reasoning state.
 */
enum class MemoryTarget {
    System1,
    System2,
    Both
};

enum class UpdateOperation {
    Add,
    Update,
    Remove
};

std::string to_string(MemoryTarget target);
std::string to_string(UpdateOperation operation);

/**
 * @brief One change requested from the memory store
 *
 * type selects the memory system, target names the collection inside it
 * ("pastInteractions", "bugPatterns", ...).
 */
struct MemoryUpdate {
    MemoryTarget type = MemoryTarget::System1;
    UpdateOperation operation = UpdateOperation::Add;
    std::string target;
    nlohmann::json data;
    nlohmann::json metadata;                           // Null when absent

    nlohmann::json to_json() const;
};

/**
 * @brief Boundary of the external dual memory store
 *
 * Implementations may throw from the update methods; callers treat each
 * update independently.
 */
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual void update_system1(const MemoryUpdate& update) = 0;
    virtual void update_system2(const MemoryUpdate& update) = 0;

    /**
     * @brief Current content of a collection; null when it does not exist
     */
    virtual nlohmann::json query(MemoryTarget system, const std::string& target) const = 0;
};

/**
 * @brief Process-local MemoryStore keeping each collection as JSON
 *
 * add appends to an array, update replaces the collection, remove erases it
 * (null data) or removes array elements equal to data.
 */
class InMemoryMemoryStore : public MemoryStore {
public:
    void update_system1(const MemoryUpdate& update) override;
    void update_system2(const MemoryUpdate& update) override;

    nlohmann::json query(MemoryTarget system, const std::string& target) const override;

    size_t update_count() const;

private:
    using Collections = std::map<std::string, nlohmann::json>;

    mutable std::mutex mutex_;
    Collections system1_;
    Collections system2_;
    size_t update_count_ = 0;

    void apply(Collections& collections, const MemoryUpdate& update);
    static nlohmann::json lookup(const Collections& collections, const std::string& target);
};

} // namespace devmem

#endif // DEVMEM_MEMORY_MEMORY_STORE_HPP
