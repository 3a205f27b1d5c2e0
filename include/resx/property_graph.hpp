#pragma once

#include <resx/result.hpp>
#include <array>
#include <string>
#include <utility>
#include <vector>

namespace resx {

// Observable properties of a ResourceEntry
enum class Property {
    Key,
    Values,
    Comment,
    Comments,
    CodeReferences,
    FileExists,
    Errors,
    IsInvariant,
    HasAnyStringFormatParameterMismatches
};

constexpr size_t kPropertyCount = 9;

const char* property_name(Property p);

// ---------------------------------------------------------------------------
// PropertyGraph: "A changed implies B must be recomputed" edges
// ---------------------------------------------------------------------------

class PropertyGraph {
public:
    // Graph with no dependencies
    PropertyGraph() = default;

    using Edge = std::pair<Property, Property>;

    // Adds every edge in order; InvalidArg at the first one closing a cycle
    static Result<PropertyGraph> from_edges(const std::vector<Edge>& edges);

    // Key -> Values, Comment; Values -> FileExists, Errors, mismatch flag;
    // Comment -> Comments, IsInvariant; IsInvariant -> mismatch flag
    static const PropertyGraph& entry_defaults();

    // InvalidArg if the edge would close a cycle
    Status add_dependency(Property from, Property to);

    bool depends_on(Property dependent, Property source) const;

    // source followed by everything reachable from it, each once, in
    // topological order (a property comes after all of its sources that
    // were themselves affected).
    std::vector<Property> affected(Property source) const;

    // Tree display rooted at source, for diagnostics
    std::string tree_display(Property source) const;

private:
    std::vector<size_t> reachable_from(size_t root) const;
    void tree_display_impl(size_t u, const std::string& prefix, bool is_last,
                           std::vector<bool>& visited, std::string& out) const;

    std::array<std::vector<size_t>, kPropertyCount> adj_;
};

} // namespace resx
