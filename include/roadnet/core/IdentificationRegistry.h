#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace roadnet {

/// Set of identifications held by the active roads of one network
///
/// Each RoadNetwork owns its registry, so independent networks never
/// see each other's identifications.
class IdentificationRegistry {
public:
    bool contains(const std::string& identification) const;

    /// Add an identification
    /// @throws DuplicateIdentificationError if it is already registered
    void acquire(const std::string& identification);

    /// Remove an identification so it can be used again (no-op if absent)
    void release(const std::string& identification);

    /// Replace `from` by `to` in one step
    /// @throws DuplicateIdentificationError if `to` is already registered;
    ///         the registry is left unchanged in that case
    void rename(const std::string& from, const std::string& to);

    size_t size() const { return identifications_.size(); }
    bool empty() const { return identifications_.empty(); }

    /// All registered identifications, sorted
    std::vector<std::string> identifications() const;

    void clear() { identifications_.clear(); }

private:
    std::unordered_set<std::string> identifications_;
};

}  // namespace roadnet
