#include <resx/property_graph.hpp>
#include <resx/log.hpp>
#include <algorithm>
#include <queue>

namespace resx {

const char* property_name(Property p) {
    switch (p) {
        case Property::Key:            return "Key";
        case Property::Values:         return "Values";
        case Property::Comment:        return "Comment";
        case Property::Comments:       return "Comments";
        case Property::CodeReferences: return "CodeReferences";
        case Property::FileExists:     return "FileExists";
        case Property::Errors:         return "Errors";
        case Property::IsInvariant:    return "IsInvariant";
        case Property::HasAnyStringFormatParameterMismatches:
            return "HasAnyStringFormatParameterMismatches";
    }
    return "Unknown";
}

static size_t index_of(Property p) {
    return static_cast<size_t>(p);
}

static PropertyGraph make_entry_defaults() {
    static const std::vector<PropertyGraph::Edge> edges = {
        {Property::Key,         Property::Values},
        {Property::Key,         Property::Comment},
        {Property::Values,      Property::FileExists},
        {Property::Values,      Property::Errors},
        {Property::Values,      Property::HasAnyStringFormatParameterMismatches},
        {Property::Comment,     Property::Comments},
        {Property::Comment,     Property::IsInvariant},
        {Property::IsInvariant, Property::HasAnyStringFormatParameterMismatches},
    };

    auto graph = PropertyGraph::from_edges(edges);
    if (graph.is_err()) {
        log::error("entry property graph: %s", graph.error().format().c_str());
        return PropertyGraph{};
    }
    return std::move(graph).value();
}

const PropertyGraph& PropertyGraph::entry_defaults() {
    static const PropertyGraph graph = make_entry_defaults();
    return graph;
}

Result<PropertyGraph> PropertyGraph::from_edges(const std::vector<Edge>& edges) {
    PropertyGraph g;
    for (const auto& [from, to] : edges) {
        RESX_TRY(g.add_dependency(from, to));
    }
    return Result<PropertyGraph>::ok(std::move(g));
}

Status PropertyGraph::add_dependency(Property from, Property to) {
    size_t f = index_of(from);
    size_t t = index_of(to);

    if (f == t || depends_on(from, to)) {
        return ResxError{ResxError::InvalidArg,
            std::string("dependency ") + property_name(from) + " -> " +
            property_name(to) + " would create a cycle"};
    }
    if (std::find(adj_[f].begin(), adj_[f].end(), t) == adj_[f].end()) {
        adj_[f].push_back(t);
    }
    return ok_status();
}

bool PropertyGraph::depends_on(Property dependent, Property source) const {
    auto reach = reachable_from(index_of(source));
    size_t d = index_of(dependent);
    return d != index_of(source) &&
        std::find(reach.begin(), reach.end(), d) != reach.end();
}

std::vector<size_t> PropertyGraph::reachable_from(size_t root) const {
    std::vector<bool> seen(kPropertyCount, false);
    std::vector<size_t> order;
    std::queue<size_t> bfs;
    bfs.push(root);
    seen[root] = true;
    while (!bfs.empty()) {
        size_t u = bfs.front();
        bfs.pop();
        order.push_back(u);
        for (size_t v : adj_[u]) {
            if (!seen[v]) {
                seen[v] = true;
                bfs.push(v);
            }
        }
    }
    return order;
}

std::vector<Property> PropertyGraph::affected(Property source) const {
    auto reachable = reachable_from(index_of(source));
    std::vector<bool> in_set(kPropertyCount, false);
    for (size_t id : reachable) in_set[id] = true;

    // Kahn's algorithm on the reachable subgraph
    std::vector<size_t> in_deg(kPropertyCount, 0);
    for (size_t id : reachable) {
        for (size_t v : adj_[id]) {
            if (in_set[v]) ++in_deg[v];
        }
    }

    std::queue<size_t> q;
    q.push(index_of(source));

    std::vector<Property> order;
    order.reserve(reachable.size());
    while (!q.empty()) {
        size_t u = q.front();
        q.pop();
        order.push_back(static_cast<Property>(u));
        for (size_t v : adj_[u]) {
            if (in_set[v] && --in_deg[v] == 0) {
                q.push(v);
            }
        }
    }
    return order;
}

std::string PropertyGraph::tree_display(Property source) const {
    std::string out;
    std::vector<bool> visited(kPropertyCount, false);
    tree_display_impl(index_of(source), "", true, visited, out);
    return out;
}

void PropertyGraph::tree_display_impl(size_t u, const std::string& prefix,
                                      bool is_last, std::vector<bool>& visited,
                                      std::string& out) const {
    out += prefix;
    if (!prefix.empty()) {
        out += is_last ? "`-- " : "|-- ";
    }
    out += property_name(static_cast<Property>(u));

    if (visited[u]) {
        out += " (*)\n";
        return;
    }
    visited[u] = true;
    out += "\n";

    const auto& edges = adj_[u];
    for (size_t i = 0; i < edges.size(); ++i) {
        std::string child_prefix = prefix;
        if (!prefix.empty()) {
            child_prefix += is_last ? "    " : "|   ";
        } else {
            child_prefix = " ";
        }
        tree_display_impl(edges[i], child_prefix, i == edges.size() - 1,
                          visited, out);
    }
}

} // namespace resx
