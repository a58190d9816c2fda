#ifndef BOOTSTEPS_FRAMEWORK_GRAPH_DEPENDENCYGRAPH_HPP
#define BOOTSTEPS_FRAMEWORK_GRAPH_DEPENDENCYGRAPH_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <boost/graph/adjacency_list.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Bootsteps
{
  /// @brief Directed graph of named nodes where an edge (a, b) means "a depends on b".
  ///
  /// Nodes keep their insertion order. TopologicalSort returns every node after the nodes it depends on; nodes
  /// without an ordering relation stay in insertion order as far as the depth first traversal allows.
  class DependencyGraph
  {
    using Graph = boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS>;
    using Vertex = boost::graph_traits<Graph>::vertex_descriptor;

    Graph m_graph;
    std::vector<std::string> m_nodes;
    std::unordered_map<std::string, Vertex> m_vertices;

  public:
    using NodeDependencies = std::pair<std::string, std::vector<std::string>>;

    DependencyGraph() = default;

    /// @brief Builds the graph from (node, nodes it depends on) pairs. Dependencies that are not listed as
    /// nodes themselves are added as nodes.
    explicit DependencyGraph(const std::vector<NodeDependencies>& nodes);

    /// @brief Adds a node. Adding an existing node does nothing.
    void AddNode(const std::string& node);

    /// @brief Adds the edge "from depends on to", adding missing nodes.
    void AddEdge(const std::string& from, const std::string& to);

    bool Contains(const std::string& node) const;

    /// @brief All nodes in insertion order.
    const std::vector<std::string>& GetNodes() const noexcept
    {
      return m_nodes;
    }

    std::size_t GetNodeCount() const noexcept
    {
      return m_nodes.size();
    }

    std::size_t GetEdgeCount() const noexcept
    {
      return boost::num_edges(m_graph);
    }

    /// @brief Nodes this node depends on, in edge insertion order.
    std::vector<std::string> GetDependencies(const std::string& node) const;

    /// @brief Orders the nodes so that every node comes after all nodes it depends on.
    /// @throws DependencyCycleException if the graph contains a cycle.
    std::vector<std::string> TopologicalSort() const;

    /// @brief Nodes that are part of a cycle, in insertion order. Empty for an acyclic graph.
    std::vector<std::string> FindCycleParticipants() const;
  };
}

#endif
