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

#include <Bootsteps/Framework/Exception/DependencyCycleException.hpp>
#include <Bootsteps/Framework/Graph/DependencyGraph.hpp>
#include <Bootsteps/Framework/Log/Log.hpp>
#include <boost/graph/exception.hpp>
#include <boost/graph/strong_components.hpp>
#include <boost/graph/topological_sort.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>

namespace Bootsteps
{
  DependencyGraph::DependencyGraph(const std::vector<NodeDependencies>& nodes)
  {
    // Add all listed nodes first so they keep their listed order
    for (const auto& [node, dependencies] : nodes)
    {
      AddNode(node);
    }
    for (const auto& [node, dependencies] : nodes)
    {
      for (const auto& dependency : dependencies)
      {
        AddEdge(node, dependency);
      }
    }
  }

  void DependencyGraph::AddNode(const std::string& node)
  {
    if (m_vertices.find(node) != m_vertices.end())
    {
      return;
    }
    const Vertex vertex = boost::add_vertex(m_graph);
    m_vertices.emplace(node, vertex);
    m_nodes.push_back(node);
  }

  void DependencyGraph::AddEdge(const std::string& from, const std::string& to)
  {
    AddNode(from);
    AddNode(to);
    boost::add_edge(m_vertices.at(from), m_vertices.at(to), m_graph);
  }

  bool DependencyGraph::Contains(const std::string& node) const
  {
    return m_vertices.find(node) != m_vertices.end();
  }

  std::vector<std::string> DependencyGraph::GetDependencies(const std::string& node) const
  {
    std::vector<std::string> result;
    auto itr = m_vertices.find(node);
    if (itr == m_vertices.end())
    {
      return result;
    }
    for (auto [edge, end] = boost::out_edges(itr->second, m_graph); edge != end; ++edge)
    {
      result.push_back(m_nodes[boost::target(*edge, m_graph)]);
    }
    return result;
  }

  std::vector<std::string> DependencyGraph::TopologicalSort() const
  {
    // boost::topological_sort emits vertices in reverse topological order. With edges pointing from a node to
    // its dependencies that is exactly dependency-first order.
    if (m_nodes.empty())
    {
      return {};
    }

    std::vector<Vertex> order;
    order.reserve(m_nodes.size());
    try
    {
      boost::topological_sort(m_graph, std::back_inserter(order));
    }
    catch (const boost::not_a_dag&)
    {
      auto participants = FindCycleParticipants();
      Log::GetLogger()->error("DependencyGraph::TopologicalSort: cycle detected between {}", fmt::join(participants, ", "));
      auto message = fmt::format("Dependency cycle detected between: {}", fmt::join(participants, ", "));
      throw DependencyCycleException(message, std::move(participants));
    }

    std::vector<std::string> result;
    result.reserve(order.size());
    for (const Vertex vertex : order)
    {
      result.push_back(m_nodes[vertex]);
    }
    return result;
  }

  std::vector<std::string> DependencyGraph::FindCycleParticipants() const
  {
    std::vector<std::string> result;
    if (m_nodes.empty())
    {
      return result;
    }

    std::vector<std::size_t> componentOf(m_nodes.size());
    const std::size_t componentCount = boost::strong_components(
      m_graph, boost::make_iterator_property_map(componentOf.begin(), boost::get(boost::vertex_index, m_graph)));

    std::vector<std::size_t> componentSize(componentCount, 0u);
    for (const std::size_t component : componentOf)
    {
      ++componentSize[component];
    }

    for (Vertex vertex = 0; vertex < m_nodes.size(); ++vertex)
    {
      const bool inLargeComponent = componentSize[componentOf[vertex]] > 1u;
      const bool selfLoop = boost::edge(vertex, vertex, m_graph).second;
      if (inLargeComponent || selfLoop)
      {
        result.push_back(m_nodes[vertex]);
      }
    }
    return result;
  }
}
