#include "modules/graph/graph.h"
#include "modules/executor/executor.h"
#include "core/types/errors.h"
#include <algorithm>
#include <functional>
#include <mutex>

namespace agentgraph {

Graph::Graph(std::string id, std::string name, std::string description)
    : id_(std::move(id)), name_(std::move(name)), description_(std::move(description)) {}

std::string Graph::description() const {
    std::shared_lock lock(mutex_);
    return description_;
}

void Graph::set_description(std::string description) {
    std::unique_lock lock(mutex_);
    description_ = std::move(description);
}

Value Graph::metadata() const {
    std::shared_lock lock(mutex_);
    return metadata_;
}

void Graph::set_metadata(Value metadata) {
    if (!metadata.is_object()) {
        throw ValidationError("graph metadata must be an object");
    }
    std::unique_lock lock(mutex_);
    metadata_ = std::move(metadata);
}

void Graph::set_metadata_value(const std::string& key, Value value) {
    std::unique_lock lock(mutex_);
    metadata_[key] = std::move(value);
}

void Graph::add_node(NodePtr node) {
    if (!node) {
        throw ValidationError("node must not be null");
    }
    try {
        node->validate();
    } catch (const ValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationError("invalid node " + node->id() + ": " + e.what());
    }

    std::unique_lock lock(mutex_);
    const std::string& node_id = node->id();
    if (nodes_.count(node_id) > 0) {
        throw ValidationError("node already exists: " + node_id);
    }
    edges_[node_id] = {};
    nodes_.emplace(node_id, std::move(node));
}

void Graph::add_edge(Edge edge) {
    if (edge.from_node.empty() || edge.to_node.empty()) {
        throw ValidationError("edge must have both from and to nodes");
    }

    std::unique_lock lock(mutex_);
    if (nodes_.count(edge.from_node) == 0) {
        throw ValidationError("from node does not exist: " + edge.from_node);
    }
    if (nodes_.count(edge.to_node) == 0) {
        throw ValidationError("to node does not exist: " + edge.to_node);
    }
    if (edge.id.empty()) {
        edge.id = edge.from_node + "->" + edge.to_node;
    }
    if (!edge.metadata.is_object()) {
        edge.metadata = Value::object();
    }
    edges_[edge.from_node].push_back(std::move(edge));
}

void Graph::set_start_node(const std::string& node_id) {
    std::unique_lock lock(mutex_);
    if (nodes_.count(node_id) == 0) {
        throw ValidationError("start node does not exist: " + node_id);
    }
    start_node_ = node_id;
}

std::string Graph::start_node() const {
    std::shared_lock lock(mutex_);
    return start_node_;
}

void Graph::validate() const {
    std::shared_lock lock(mutex_);

    if (nodes_.empty()) {
        throw ValidationError("graph must have at least one node");
    }
    if (start_node_.empty()) {
        throw ValidationError("start node must be set");
    }
    if (nodes_.count(start_node_) == 0) {
        throw ValidationError("start node does not exist: " + start_node_);
    }

    for (const auto& [node_id, node] : nodes_) {
        try {
            node->validate();
        } catch (const std::exception& e) {
            throw ValidationError("node " + node_id + " validation failed: " + e.what());
        }
    }

    for (const auto& [from, list] : edges_) {
        for (const auto& edge : list) {
            if (nodes_.count(edge.from_node) == 0 || nodes_.count(edge.to_node) == 0) {
                throw ValidationError("edge " + edge.id + " references a missing node");
            }
        }
    }

    detect_cycles();
}

void Graph::detect_cycles() const {
    enum class Color : uint8_t { WHITE, GREY, BLACK };
    std::unordered_map<std::string, Color> color;
    color.reserve(nodes_.size());

    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [node_id, _] : nodes_) {
        ids.push_back(node_id);
        color[node_id] = Color::WHITE;
    }
    std::sort(ids.begin(), ids.end());

    // Guarded edges are opaque: a loop through one may legitimately terminate.
    std::function<void(const std::string&)> visit = [&](const std::string& node_id) {
        color[node_id] = Color::GREY;
        auto it = edges_.find(node_id);
        if (it != edges_.end()) {
            for (const auto& edge : it->second) {
                if (edge.condition) {
                    continue;
                }
                Color c = color[edge.to_node];
                if (c == Color::GREY) {
                    throw ValidationError("graph contains cycles (" + edge.from_node + " -> " + edge.to_node + ")");
                }
                if (c == Color::WHITE) {
                    visit(edge.to_node);
                }
            }
        }
        color[node_id] = Color::BLACK;
    };

    for (const auto& node_id : ids) {
        if (color[node_id] == Color::WHITE) {
            visit(node_id);
        }
    }
}

bool Graph::has_node(const std::string& node_id) const {
    std::shared_lock lock(mutex_);
    return nodes_.count(node_id) > 0;
}

NodePtr Graph::get_node(const std::string& node_id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(node_id);
    return it != nodes_.end() ? it->second : nullptr;
}

std::vector<Edge> Graph::get_edges(const std::string& node_id) const {
    std::shared_lock lock(mutex_);
    auto it = edges_.find(node_id);
    if (it == edges_.end()) {
        return {};
    }
    return it->second;
}

std::vector<NodePtr> Graph::all_nodes() const {
    std::vector<NodePtr> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(nodes_.size());
        for (const auto& [_, node] : nodes_) {
            result.push_back(node);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const NodePtr& a, const NodePtr& b) { return a->id() < b->id(); });
    return result;
}

std::vector<Edge> Graph::all_edges() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> sources;
    sources.reserve(edges_.size());
    for (const auto& [from, _] : edges_) {
        sources.push_back(from);
    }
    std::sort(sources.begin(), sources.end());

    std::vector<Edge> result;
    for (const auto& from : sources) {
        const auto& list = edges_.at(from);
        result.insert(result.end(), list.begin(), list.end());
    }
    return result;
}

size_t Graph::node_count() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

size_t Graph::edge_count() const {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    for (const auto& [_, list] : edges_) {
        count += list.size();
    }
    return count;
}

void Graph::remove_node(const std::string& node_id) {
    std::unique_lock lock(mutex_);
    if (nodes_.erase(node_id) == 0) {
        throw ValidationError("node does not exist: " + node_id);
    }
    edges_.erase(node_id);
    for (auto& [from, list] : edges_) {
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const Edge& e) { return e.to_node == node_id; }),
                   list.end());
    }
    if (start_node_ == node_id) {
        start_node_.clear();
    }
}

void Graph::remove_edge(const std::string& edge_id) {
    std::unique_lock lock(mutex_);
    for (auto& [from, list] : edges_) {
        auto it = std::find_if(list.begin(), list.end(),
                               [&](const Edge& e) { return e.id == edge_id; });
        if (it != list.end()) {
            list.erase(it);
            return;
        }
    }
    throw ValidationError("edge not found: " + edge_id);
}

std::unique_ptr<Graph> Graph::clone() const {
    std::shared_lock lock(mutex_);
    auto copy = std::make_unique<Graph>(id_ + "_clone", name_ + "_clone", description_);
    copy->nodes_ = nodes_;
    copy->edges_ = edges_;
    copy->start_node_ = start_node_;
    copy->metadata_ = metadata_;
    return copy;
}

WorkflowOutput Graph::execute(const ExecutionContext& ctx, const WorkflowInput& input) const {
    Executor executor;
    return executor.execute(ctx, *this, input);
}

} // namespace agentgraph
